#pragma once
#include <cstddef>
#include <string>
#include <string_view>
#include <unordered_set>

namespace amb {

using NameSet = std::unordered_set<std::string>;

// Slug -> unused 8.3 article name ("getting-started" -> "GETTING_.AMA").
// The returned name is added to taken.
std::string assign_article_name(std::string_view slug, NameSet& taken);

// Name of continuation part `part` (1-based) of an article: "GUIDE01.AMA".
// The returned name is added to taken.
std::string continuation_name(std::string_view article_name, size_t part, NameSet& taken);

} // namespace amb
