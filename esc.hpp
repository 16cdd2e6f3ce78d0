#ifndef ESC_DOT_HPP
#define ESC_DOT_HPP

#include <string>
#include <string_view>

// C style escapes for logging protocol data; with multi, each escaped
// newline is followed by a real one.
enum class esc_line_option : bool { single, multi };

std::string esc(std::string_view str,
                esc_line_option  line_option = esc_line_option::single);

#endif // ESC_DOT_HPP
