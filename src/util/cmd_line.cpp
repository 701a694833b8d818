#include "util/cmd_line.h"

namespace pnpc
{

  using namespace std;

  cmd_line::cmd_line(int argc, const char **argv)
  {
    assert(argc > 0 && argv);

    string s;

    for (int i = 1; i < argc; ++i)
    {
      assert(argv[i]);
      s = argv[i];
      if (s.size() < 2)
      {
        cout << "Warning: Not a valid flag  \"" << s << "\" discarding" << endl;
        num_warnings_++;
        continue;
      }
      else if ('-' == s[0])
      {
        if ('-' == s[1] && s != "--help")
        { // param key
          string key = s;
          if (i + 1 < argc)
          {
            params_[key] = argv[i + 1];
            ++i;
          }
          else
          {
            cout << "Warning: Key " << key << " did not get a value" << endl;
            num_warnings_++;
          }
        }
        else
        { // flag
          flags_.insert(s);
        }
      }
      else
      { // param value
        cout << "Warning: No key for value " << s << endl;
        num_warnings_++;
      }
    }
  }

  void cmd_line::set_flag(const string &fl) { flags_.insert(fl); }

  void cmd_line::set_param_value(const string &key, const string &val) { params_[key] = val; }

  void cmd_line::print_options() const
  {
    // sort by name
    vector<string> F(flags_.begin(), flags_.end());
    std::sort(F.begin(), F.end());

    cout << "Flags :\n";
    for (const auto &f : F)
      cout << "\t" << f << endl;
    cout << "Params :" << endl;

    vector<pair<string, string>> V;
    V.reserve(params_.size());
    for (const auto &p : params_)
      V.emplace_back(p.first, p.second);

    std::sort(V.begin(), V.end());

    for (const auto &p : V)
      cout << '\t' << p.first << '\t' << p.second << endl;
  }
} // namespace pnpc
