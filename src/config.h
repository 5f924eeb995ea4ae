#ifndef LARYNX_CONFIG_H
#define LARYNX_CONFIG_H

#include "common.h"
#include <unordered_map>
#include <fstream>

/** Flat key = value config files.

  Keys are dotted by section, eg "mel.n_filters = 32".
  Lines beginning with '#' are comments.
  Every lookup that differs from its default is logged.
*/

class ConfigParser
{
  typedef std::unordered_map<string, string> Dict;
  typedef Dict::const_iterator Auto;
  Dict m_dict;
  const string m_filename;

public:

  ConfigParser () : m_filename("(defaults)") {}
  ConfigParser (const char * filename)
    : m_filename(filename)
  {
    std::ifstream file(filename);
    ASSERT(file, "failed to open config file " << filename);

    string comment, key, equals, value;
    while (file) {
      int peek = file.peek();
      if (peek == EOF) {
        break;
      } else if (isspace(peek)) {
        file.get();
      } else if (peek == '#') {
        std::getline(file, comment);
      } else {
        file >> key >> equals >> value;
        ASSERT(equals == "=",
            "malformed line in " << filename << " at key " << key);
        m_dict[key] = value;
      }
    }
  }

  const string & filename () const { return m_filename; }
  bool has (string key) const { return m_dict.find(key) != m_dict.end(); }
  void set (string key, string value) { m_dict[key] = value; }

  string operator() (string key, string default_value) const
  {
    Auto i = m_dict.find(key);
    const string & value = (i == m_dict.end()) ? default_value : i->second;
    if (value != default_value) {
      LOG(" " << m_filename << ": " << key << " = " << value
          << " (default = " << default_value << ")");
    }
    return value;
  }
  string operator() (string key, const char * default_value) const
  {
    return operator()(key, string(default_value));
  }

  int operator() (string key, int default_value) const
  {
    Auto i = m_dict.find(key);
    int value = (i == m_dict.end()) ? default_value : atoi(i->second.c_str());
    if (value != default_value) {
      LOG(" " << m_filename << ": " << key << " = " << value
          << " (default = " << default_value << ")");
    }
    return value;
  }

  // counts and sizes must be nonnegative
  size_t operator() (string key, size_t default_value) const
  {
    int value = operator()(key, int(default_value));
    ASSERT_LE(0, value);
    return value;
  }

  float operator() (string key, float default_value) const
  {
    Auto i = m_dict.find(key);
    float value = (i == m_dict.end()) ? default_value : atof(i->second.c_str());
    if (value != default_value) {
      LOG(" " << m_filename << ": " << key << " = " << value
          << " (default = " << default_value << ")");
    }
    return value;
  }

  // accepts 1/0, true/false, on/off
  bool operator() (string key, bool default_value) const
  {
    Auto i = m_dict.find(key);
    bool value = default_value;
    if (i != m_dict.end()) {
      const string & s = i->second;
      if (s == "1" or s == "true" or s == "on") {
        value = true;
      } else if (s == "0" or s == "false" or s == "off") {
        value = false;
      } else {
        ERROR(m_filename << ": " << key << " expects a boolean, got " << s);
      }
    }
    if (value != default_value) {
      LOG(" " << m_filename << ": " << key << " = " << value
          << " (default = " << default_value << ")");
    }
    return value;
  }
};

#endif // LARYNX_CONFIG_H

