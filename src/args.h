#ifndef LARYNX_ARGS_H
#define LARYNX_ARGS_H

#include <stdint.h>
#include <cstdlib>
#include <iostream>
#include <string>
#include <vector>
#include <map>

/** Command-line dispatch for tools and test programs.

  Usage:
    args
      .case_("mel", test_mel)
      .case_("gabor", test_gabor)
      .default_all();   // no command runs every case
*/

struct Args
{
  int argc;
  char ** argv;
  const char * help;

  class Switch
  {
  public:

    typedef void (* Function)(Args &);
    class Action
    {
      enum Type { NONE, CALL, INT, FLOAT, STRING };
      Type m_type;

      Function m_fun;
      int * m_int;
      float * m_float;
      std::string * m_string;

    public:

      Action ()           : m_type(NONE) {}
      Action (Function f) : m_type(CALL), m_fun(f) {}
      Action (int & i)    : m_type(INT), m_int(& i) {}
      Action (float & f)  : m_type(FLOAT), m_float(& f) {}
      Action (std::string & s) : m_type(STRING), m_string(& s) {}

      void operator() (Args & args)
      {
        switch (m_type) {
          case NONE: break;
          case CALL: m_fun(args); break;
          case INT: * m_int = atoi(args.pop()); break;
          case FLOAT: * m_float = atof(args.pop()); break;
          case STRING: * m_string = args.pop(); break;
        }
      }
    };

  private:

    typedef std::map<std::string, Action> Cases;
    typedef Cases::iterator Case;

    Args & m_args;
    Cases m_cases;
    void print_error (const std::string & message);

  public:

    Switch (Args & args);
    ~Switch () {}

    Switch & case_ (std::string key, Action action);
    void default_error ();
    void default_all ();
  };

  const char * top () { return * argv; }

public:

  Args (int c, char ** v, const char * h) : argc(c-1), argv(v+1), help(h) {}
  ~Args ();

  size_t size () const { return argc; }

  const char * pop ()
  {
    if (not argc--) {
      std::cout << help << std::endl;
      std::cout << "ERROR too few arguments" << std::endl;
      exit(1);
    }
    return *(argv++);
  }

  const char * pop (const char * default_value)
  {
    if (not argc) return default_value;
    --argc;
    return *(argv++);
  }
  int pop (int default_value)
  {
    if (not argc) return default_value;
    --argc;
    return atoi(*(argv++));
  }
  float pop (float default_value)
  {
    if (not argc) return default_value;
    --argc;
    return atof(*(argv++));
  }

  std::vector<std::string> pop_all ()
  {
    std::vector<std::string> result;
    while (argc) result.push_back(pop());
    return result;
  }

  Switch case_ (std::string key, Switch::Action action);
};

#endif // LARYNX_ARGS_H

