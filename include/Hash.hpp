#pragma once
#include <string>

// Desc: SHA-256 of data as lowercase hex (64 chars)
std::string sha256_hex(const std::string& data);
