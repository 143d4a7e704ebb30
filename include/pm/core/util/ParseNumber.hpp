#pragma once

#include <stdexcept>
#include <string>

namespace pm {

/**
 * Parse a plain decimal number such as "12", "-0.5" or "1e-3".
 *
 * Hex literals, inf and nan are rejected, as is any trailing text. std::stod
 * reads the decimal point of the C locale, which is in effect unless the
 * program calls setlocale.
 * @returns false if text is not a complete decimal number
 */
inline bool parseDecimal(const std::string& text, double& value)
{
    if (text.empty() || text.find_first_not_of("0123456789+-.eE") != std::string::npos) {
        return false;
    }
    size_t consumed = 0;
    try {
        value = std::stod(text, &consumed);
    } catch (const std::invalid_argument&) {
        return false;
    } catch (const std::out_of_range&) {
        return false;
    }
    return consumed == text.size();
}

} // namespace pm
