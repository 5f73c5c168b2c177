#pragma once

#include <algorithm>
#include <string>
#include <string_view>
#include <vector>

namespace util {

    inline bool startsWith(std::string_view target, std::string_view prefix) {
        if(prefix.length() > target.length()) {
            return false;
        }
        return target.substr(0, prefix.length()) == prefix;
    }

    inline bool isSpace(char c) noexcept {
        // important: ignore Locale to ensure portability
        return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v';
    }

    inline std::string_view trim(std::string_view target) {
        auto first = std::find_if_not(target.begin(), target.end(), isSpace);
        auto last = std::find_if_not(target.rbegin(), target.rend(), isSpace).base();
        if(first >= last) {
            return {};
        }
        return target.substr(first - target.begin(), last - first);
    }

    inline std::string_view trimTrailing(std::string_view target, char c) {
        auto pos = target.find_last_not_of(c);
        if(pos == std::string_view::npos) {
            return {};
        }
        return target.substr(0, pos + 1);
    }

    /**
     * Replace every run of characters from the set with a single replacement string,
     * e.g. collapseRuns("a::/b", ":/", "-") == "a-b"
     */
    inline std::string collapseRuns(
        std::string_view target, std::string_view set, std::string_view replacement) {
        std::string result;
        result.reserve(target.size());
        bool inRun = false;
        for(char c : target) {
            if(set.find(c) != std::string_view::npos) {
                if(!inRun) {
                    result.append(replacement);
                    inRun = true;
                }
            } else {
                result.push_back(c);
                inRun = false;
            }
        }
        return result;
    }

    inline std::string replaceAll(std::string_view target, char from, char to) {
        std::string result{target};
        std::replace(result.begin(), result.end(), from, to);
        return result;
    }

    inline std::string join(const std::vector<std::string> &parts, std::string_view separator) {
        std::string result;
        for(auto i = parts.begin(); i != parts.end(); ++i) {
            if(i != parts.begin()) {
                result.append(separator);
            }
            result.append(*i);
        }
        return result;
    }

    inline int lowerChar(int c) {
        if(c >= 'A' && c <= 'Z') {
            return c - 'A' + 'a';
        } else {
            return c;
        }
    }

    inline int upperChar(int c) {
        if(c >= 'a' && c <= 'z') {
            return c - 'a' + 'A';
        } else {
            return c;
        }
    }

    inline std::string lower(std::string_view source) {
        std::string target;
        target.resize(source.size());
        std::transform(source.begin(), source.end(), target.begin(), lowerChar);
        return target;
    }

    inline std::string upper(std::string_view source) {
        std::string target;
        target.resize(source.size());
        std::transform(source.begin(), source.end(), target.begin(), upperChar);
        return target;
    }
} // namespace util
