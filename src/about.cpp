#include "gambit/about.hpp"

namespace gambit {

std::string program_name() {
  return "gambit";
}

std::string about_message() {
  return program_name() + " - chess against an external engine or a built-in search";
}

void print_about(std::ostream& os) {
  os << about_message() << '\n';
}

} // namespace gambit
