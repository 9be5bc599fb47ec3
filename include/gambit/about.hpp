#pragma once

#include <ostream>
#include <string>

namespace gambit {

std::string program_name();
std::string about_message();
void print_about(std::ostream& os);

} // namespace gambit
