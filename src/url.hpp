#pragma once

#include <string>

struct Url {
    std::string text;
    std::string scheme;     // lower case
    std::string host;       // empty for file:// URLs
    std::string path;       // as written, still percent-encoded
    std::string directory;  // percent-decoded path without the file name, ends with '/'
    std::string file_name;  // last path segment, as written
};

// Throws InvalidRequestError when the URL cannot be parsed or names no file.
Url parse_url(const std::string& text);
