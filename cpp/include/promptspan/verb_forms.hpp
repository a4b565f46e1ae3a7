#pragma once

#include <mutex>
#include <set>
#include <string>
#include <unordered_map>

namespace promptspan {

/**
 * Surface forms of an English base verb.
 *
 * generate() is a pure function: base form, third person singular, present
 * participle, past and past participle, using regular spelling rules with an
 * irregular override table ("run" -> ran, "lie" -> lay/lain/lying).
 */
class VerbForms {
public:
    static std::set<std::string> generate(const std::string& base);

    static std::string third_person(const std::string& base);
    static std::string present_participle(const std::string& base);
    static std::string past(const std::string& base);

    // Memoized generate(); each base is expanded once per process.
    static const std::set<std::string>& forms(const std::string& base);

private:
    static bool is_vowel(char c) noexcept;
    static bool doubles_final_consonant(const std::string& base);

    static std::mutex cache_mutex_;
    static std::unordered_map<std::string, std::set<std::string>> cache_;
};

} // namespace promptspan
