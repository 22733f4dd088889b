#include "amb/naming.h"

#include <algorithm>
#include <cstdio>

namespace amb {

namespace {

constexpr size_t kBaseLen = 8;
constexpr const char* kArticleExt = ".AMA";

static std::string two_digits(size_t v) {
    char buf[24];
    std::snprintf(buf, sizeof(buf), "%02zu", v);
    return buf;
}

static std::string trimmed(std::string_view base, size_t suffix_len) {
    const size_t keep = std::max<size_t>(1, kBaseLen > suffix_len ? kBaseLen - suffix_len : 1);
    return std::string(base.substr(0, std::min(keep, base.size())));
}

} // namespace

std::string assign_article_name(std::string_view slug, NameSet& taken) {
    std::string base;
    base.reserve(slug.size());
    for (unsigned char c : slug) {
        if (c >= 'a' && c <= 'z') base.push_back((char)(c - 'a' + 'A'));
        else if ((c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9')) base.push_back((char)c);
        else base.push_back('_');
    }
    if (base.empty()) base = "ARTICLE";
    if (base[0] >= '0' && base[0] <= '9') base.insert(base.begin(), '_');
    if (base.size() > kBaseLen) base.resize(kBaseLen);

    std::string name = base + kArticleExt;
    size_t counter = 1;
    while (taken.count(name)) {
        const std::string suffix = two_digits(counter++);
        name = trimmed(base, suffix.size()) + suffix + kArticleExt;
    }
    taken.insert(name);
    return name;
}

std::string continuation_name(std::string_view article_name, size_t part, NameSet& taken) {
    const std::string_view stem = article_name.substr(0, article_name.find('.'));

    std::string suffix = two_digits(part);
    std::string name = trimmed(stem, suffix.size()) + suffix + kArticleExt;
    size_t counter = 1;
    while (taken.count(name)) {
        suffix = two_digits(part) + std::to_string(counter++);
        name = trimmed(stem, suffix.size()) + suffix + kArticleExt;
    }
    taken.insert(name);
    return name;
}

} // namespace amb
