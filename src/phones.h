#ifndef LARYNX_PHONES_H
#define LARYNX_PHONES_H

/** Phone sequencing for the vocal tract.

  A phone table maps phone names to a target control frame held for
  duration + transition msec. A dictionary maps words to phone strings:

    phones   := phone (sep phone)* [%]
    sep      := _ | .          (. also marks a syllable boundary)
    phone    := ['|"] name     (' stressed, " double stressed)

  A stressed phone is looked up as its name followed by '.
  Text files hold one entry per line; lines starting with ';' are comments.

    phone table:  name duration transition v1 ... v15
    dictionary:   word phones
*/

#include "common.h"
#include "vocal_tract.h"
#include <map>

namespace Trm
{

#define PAUSE_PHONE "#"

struct Phone
{
  string name;
  float duration;     // msec
  float transition;   // msec
  Control frame;

  Phone () : duration(0), transition(0) {}
};

class PhoneTable
{
  typedef std::map<string, Phone> Map;
  Map m_phones;

public:

  PhoneTable () {}
  PhoneTable (const char * filename) { load(filename); }

  size_t size () const { return m_phones.size(); }
  bool empty () const { return m_phones.empty(); }

  void load (const char * filename);
  void load (istream & stream, const char * source = "(stream)");
  void add (const Phone & phone) { m_phones[phone.name] = phone; }

  bool lookup (const string & name, Phone & phone) const;
};

class Dictionary
{
  typedef std::map<string, string> Map;
  Map m_words;

public:

  Dictionary () {}
  Dictionary (const char * filename) { load(filename); }

  size_t size () const { return m_words.size(); }

  void load (const char * filename);
  void load (istream & stream, const char * source = "(stream)");
  void add (const string & word, const string & phones)
  {
    m_words[word] = phones;
  }

  bool lookup (const string & word, string & phones) const;
};

//----( sequencer )-----------------------------------------------------------

class PhoneSequencer
{
  VocalTract & m_tract;
  const PhoneTable & m_phones;
  const Dictionary * m_dict;

public:

  PhoneSequencer (
      VocalTract & tract,
      const PhoneTable & phones,
      const Dictionary * dict = NULL)
    : m_tract(tract),
      m_phones(phones),
      m_dict(dict)
  {}

  // control frames needed to reach and hold a phone
  size_t num_frames (const Phone & phone) const;

  // these return false if a phone or word is not found
  bool synth_phone (
      const string & name,
      bool stress = false,
      bool double_stress = false,
      bool syllable = false,
      bool reset = false);
  bool synth_phones (const string & phones, bool reset_first = true);
  bool synth_word (const string & word, bool reset_first = true);
  bool synth_words (const string & words, bool reset_first = true);
};

} // namespace Trm

#endif // LARYNX_PHONES_H
