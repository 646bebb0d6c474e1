// Cross-platform environment setters for tests: _putenv_s on Windows, setenv/unsetenv elsewhere.

#include "test_env.hpp"
#include <cstdlib>
#include <string>

namespace imp::test {

void set_env(const std::string& name, const std::string& value)
{
#if defined(_WIN32)
    _putenv_s(name.c_str(), value.c_str());
#else
    ::setenv(name.c_str(), value.c_str(), 1);
#endif
}

void unset_env(const std::string& name)
{
#if defined(_WIN32)
    _putenv_s(name.c_str(), "");
#else
    ::unsetenv(name.c_str());
#endif
}

} // namespace imp::test
