#pragma once

#include <iostream>
#include <optional>
#include <string>

namespace mediapush::core {

// Line-based prompts for the interactive mode. Both keep asking until the
// answer is valid; a blank answer selects the default. End of input throws
// ConfigurationError. Integer bounds are inclusive.
bool prompt_yes_no(const std::string& prompt, bool default_yes,
                   std::istream& in = std::cin, std::ostream& out = std::cout);

std::optional<long long> prompt_int(const std::string& prompt,
                                    std::optional<long long> default_value,
                                    std::optional<long long> min_value,
                                    std::optional<long long> max_value,
                                    std::istream& in = std::cin, std::ostream& out = std::cout);

}
