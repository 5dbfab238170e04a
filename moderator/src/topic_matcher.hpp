
#pragma once
#include <string>

// Topic exchange binding match. Words are separated by '.', '*' matches
// exactly one word and '#' matches zero or more words.
bool topic_matches(const std::string& binding_key, const std::string& routing_key);
