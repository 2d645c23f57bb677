#ifndef TILESCRIPT_TEST_UTILS_H
#define TILESCRIPT_TEST_UTILS_H

#include <string>

namespace tilescript {
namespace test {

/** Path to tests/data, injected by CMake. */
const char* test_data_dir();

/* Reads tests/data/<name>; empty string if missing. */
std::string read_data_file(const std::string& name);

}  // namespace test
}  // namespace tilescript

#endif
