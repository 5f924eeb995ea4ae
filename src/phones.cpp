
#include "phones.h"
#include <fstream>
#include <sstream>

#define LOG1(mess)

namespace Trm
{

namespace
{

// true for lines holding an entry
bool is_entry (const string & line)
{
  size_t pos = line.find_first_not_of(" \t\r");
  return pos != string::npos and line[pos] != ';';
}

} // anonymous namespace

//----( phone table )---------------------------------------------------------

void PhoneTable::load (const char * filename)
{
  std::ifstream file(filename);
  ASSERT(file, "failed to open phone table " << filename);
  load(file, filename);
}

void PhoneTable::load (istream & stream, const char * source)
{
  string line;
  size_t line_num = 0;
  while (std::getline(stream, line)) {
    ++line_num;
    if (not is_entry(line)) continue;

    std::istringstream fields(line);
    Phone phone;
    fields >> phone.name >> phone.duration >> phone.transition;
    for (size_t i = 0; i < NUM_CONTROLS; ++i) {
      fields >> phone.frame[i];
    }
    ASSERT(fields, "malformed phone at " << source << ":" << line_num
        << ", expected name duration transition and "
        << NUM_CONTROLS << " control values");
    ASSERT(phone.duration >= 0 and phone.transition >= 0,
        "negative phone duration at " << source << ":" << line_num);

    add(phone);
  }

  LOG("loaded " << size() << " phones from " << source);
}

bool PhoneTable::lookup (const string & name, Phone & phone) const
{
  Map::const_iterator i = m_phones.find(name);
  if (i == m_phones.end()) return false;
  phone = i->second;
  return true;
}

//----( dictionary )----------------------------------------------------------

void Dictionary::load (const char * filename)
{
  std::ifstream file(filename);
  ASSERT(file, "failed to open dictionary " << filename);
  load(file, filename);
}

void Dictionary::load (istream & stream, const char * source)
{
  string line;
  size_t line_num = 0;
  while (std::getline(stream, line)) {
    ++line_num;
    if (not is_entry(line)) continue;

    std::istringstream fields(line);
    string word, phones;
    fields >> word >> phones;
    ASSERT(fields, "malformed word at " << source << ":" << line_num
        << ", expected word and phones");

    add(word, phones);
  }

  LOG("loaded " << size() << " words from " << source);
}

bool Dictionary::lookup (const string & word, string & phones) const
{
  Map::const_iterator i = m_words.find(word);
  if (i == m_words.end()) return false;
  phones = i->second;
  return true;
}

//----( sequencer )-----------------------------------------------------------

size_t PhoneSequencer::num_frames (const Phone & phone) const
{
  const float total = 1.5f * (phone.duration + phone.transition);
  const float frames = ceilf(total / m_tract.synth().duration_msec);
  return size_t(max(1.0f, frames));
}

bool PhoneSequencer::synth_phone (
    const string & name,
    bool stress,
    bool double_stress,
    bool syllable,
    bool reset)
{
  const string key = stress ? name + "'" : name;

  Phone phone;
  if (not m_phones.lookup(key, phone)) {
    WARN("phone not found: " << key);
    return false;
  }

  const size_t frames = num_frames(phone);
  LOG1("saying " << key << " for " << frames << " frames"
      << (double_stress ? ", double stress" : "")
      << (syllable ? ", end of syllable" : ""));

  m_tract.control() = phone.frame;
  if (reset) m_tract.init_synth();

  for (size_t i = 0; i < frames; ++i) {
    m_tract.synthesize();
  }

  return true;
}

bool PhoneSequencer::synth_phones (const string & phones, bool reset_first)
{
  string name;
  bool stress = false;
  bool double_stress = false;
  bool syllable = false;
  bool first = true;

  for (size_t pos = 0; pos < phones.size(); ++pos) {
    const char c = phones[pos];

    switch (c) {
      case '\'':
        stress = true;
        break;

      case '"':
        double_stress = true;
        break;

      case '.':
      case '_':
      case '%':
        if (c == '.') syllable = true;
        if (not name.empty()) {
          if (not synth_phone(name, stress, double_stress, syllable,
                              reset_first and first)) {
            return false;
          }
          first = false;
        }
        if (c == '%') return true;
        name.clear();
        stress = double_stress = syllable = false;
        break;

      default:
        name += c;
    }
  }

  if (not name.empty()) {
    return synth_phone(name, stress, double_stress, syllable,
                       reset_first and first);
  }
  return true;
}

bool PhoneSequencer::synth_word (const string & word, bool reset_first)
{
  ASSERT(m_dict, "no dictionary loaded");

  string phones;
  if (not m_dict->lookup(word, phones)) {
    WARN("word not found: " << word);
    return false;
  }
  return synth_phones(phones, reset_first);
}

bool PhoneSequencer::synth_words (const string & words, bool reset_first)
{
  std::istringstream stream(words);
  string word;
  bool first = true;
  while (stream >> word) {
    if (not first) {
      if (not synth_phone(PAUSE_PHONE)) return false;
    }
    if (not synth_word(word, reset_first and first)) return false;
    first = false;
  }
  return true;
}

} // namespace Trm

