#pragma once

#include <string>

namespace indevolt
{

/**
 * Percent-encodes everything except the RFC 3986 unreserved characters
 * @param text Raw query parameter value
 * @return Encoded value, e.g. "{\"t\":[1]}" becomes "%7B%22t%22%3A%5B1%5D%7D"
 */
std::string url_encode(const std::string& text);

} // namespace indevolt
