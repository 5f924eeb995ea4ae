
#include "args.h"
#include <sstream>

using std::cout;
using std::endl;
using std::string;

Args::Switch::Switch (Args & args)
  : m_args(args),
    m_cases()
{}

Args::Switch & Args::Switch::case_ (
    string key,
    Args::Switch::Action action)
{
  m_cases[key] = action;
  return * this;
}

void Args::Switch::print_error (const string & message)
{
  cout << m_args.help << "\nERROR " << message;
  cout << "\ntry one of:";
  for (Case i = m_cases.begin(); i != m_cases.end(); ++i) {
    cout << " " << i->first;
  }
  cout << endl;
  exit(1);
}

void Args::Switch::default_error ()
{
  if (not m_args.size()) print_error("missing command.");

  string arg = m_args.pop();
  Case i = m_cases.find(arg);
  if (i == m_cases.end()) print_error("unknown command: " + arg);

  i->second(m_args);
}

void Args::Switch::default_all ()
{
  if (not m_args.size()) {
    for (Case i = m_cases.begin(); i != m_cases.end(); ++i) {
      cout << "---- " << i->first << " ----" << endl;
      i->second(m_args);
    }
  } else {
    string arg = m_args.pop();
    Case i = m_cases.find(arg);
    if (i == m_cases.end()) print_error("unknown command: " + arg);

    i->second(m_args);
  }
}

Args::Switch Args::case_ (string key, Args::Switch::Action action)
{
  Switch result(* this);
  result.case_(key, action);
  return result;
}

Args::~Args ()
{
  if (size()) {
    std::ostringstream s;
    s << "WARNING the following arguments were not used:";
    while (size()) s << " " << pop();
    cout << s.str() << endl;
  }
}

