#include "promptspan/verb_forms.hpp"

#include <vector>

namespace promptspan {

namespace {

struct Irregular {
    std::vector<std::string> past_forms;   // simple past and past participle
    std::string participle;                // present participle override, empty if regular
};

const std::unordered_map<std::string, Irregular>& irregulars() {
    static const std::unordered_map<std::string, Irregular> table = {
        {"be",     {{"was", "were", "been"}, "being"}},
        {"bend",   {{"bent"}, ""}},
        {"bite",   {{"bit", "bitten"}, ""}},
        {"blow",   {{"blew", "blown"}, ""}},
        {"catch",  {{"caught"}, ""}},
        {"climb",  {{"climbed"}, ""}},
        {"come",   {{"came", "come"}, ""}},
        {"creep",  {{"crept"}, ""}},
        {"dig",    {{"dug"}, ""}},
        {"dive",   {{"dove", "dived"}, ""}},
        {"draw",   {{"drew", "drawn"}, ""}},
        {"drink",  {{"drank", "drunk"}, ""}},
        {"drive",  {{"drove", "driven"}, ""}},
        {"eat",    {{"ate", "eaten"}, ""}},
        {"fall",   {{"fell", "fallen"}, ""}},
        {"fight",  {{"fought"}, ""}},
        {"flee",   {{"fled"}, ""}},
        {"fly",    {{"flew", "flown"}, ""}},
        {"get",    {{"got", "gotten"}, ""}},
        {"give",   {{"gave", "given"}, ""}},
        {"go",     {{"went", "gone"}, ""}},
        {"grow",   {{"grew", "grown"}, ""}},
        {"hang",   {{"hung", "hanged"}, ""}},
        {"hide",   {{"hid", "hidden"}, ""}},
        {"hold",   {{"held"}, ""}},
        {"kneel",  {{"knelt", "kneeled"}, ""}},
        {"lean",   {{"leaned", "leant"}, ""}},
        {"leap",   {{"leapt", "leaped"}, ""}},
        {"lie",    {{"lay", "lain"}, "lying"}},
        {"ride",   {{"rode", "ridden"}, ""}},
        {"rise",   {{"rose", "risen"}, ""}},
        {"run",    {{"ran", "run"}, ""}},
        {"shake",  {{"shook", "shaken"}, ""}},
        {"shine",  {{"shone", "shined"}, ""}},
        {"sing",   {{"sang", "sung"}, ""}},
        {"sink",   {{"sank", "sunk"}, ""}},
        {"sit",    {{"sat"}, ""}},
        {"sleep",  {{"slept"}, ""}},
        {"slide",  {{"slid"}, ""}},
        {"speak",  {{"spoke", "spoken"}, ""}},
        {"spin",   {{"spun"}, ""}},
        {"stand",  {{"stood"}, ""}},
        {"stride", {{"strode", "stridden"}, ""}},
        {"strike", {{"struck"}, ""}},
        {"sweep",  {{"swept"}, ""}},
        {"swim",   {{"swam", "swum"}, ""}},
        {"swing",  {{"swung"}, ""}},
        {"take",   {{"took", "taken"}, ""}},
        {"tear",   {{"tore", "torn"}, ""}},
        {"throw",  {{"threw", "thrown"}, ""}},
        {"wear",   {{"wore", "worn"}, ""}},
        {"weep",   {{"wept"}, ""}},
        {"wind",   {{"wound"}, ""}},
        {"write",  {{"wrote", "written"}, ""}},
    };
    return table;
}

bool ends_with(const std::string& s, const char* suffix) {
    std::string suf(suffix);
    return s.size() >= suf.size() && s.compare(s.size() - suf.size(), suf.size(), suf) == 0;
}

} // namespace

std::mutex VerbForms::cache_mutex_;
std::unordered_map<std::string, std::set<std::string>> VerbForms::cache_;

bool VerbForms::is_vowel(char c) noexcept {
    return c == 'a' || c == 'e' || c == 'i' || c == 'o' || c == 'u';
}

// One-syllable consonant-vowel-consonant verbs double the final consonant: "nod" -> "nodding".
bool VerbForms::doubles_final_consonant(const std::string& base) {
    if (base.size() < 3) return false;
    char last = base[base.size() - 1];
    char mid = base[base.size() - 2];
    char first = base[base.size() - 3];
    if (is_vowel(last) || last == 'w' || last == 'x' || last == 'y') return false;
    if (!is_vowel(mid) || is_vowel(first)) return false;

    int vowel_groups = 0;
    bool in_group = false;
    for (char c : base) {
        bool v = is_vowel(c);
        if (v && !in_group) ++vowel_groups;
        in_group = v;
    }
    return vowel_groups == 1;
}

std::string VerbForms::third_person(const std::string& base) {
    if (base == "be") return "is";
    if (base == "have") return "has";
    if (ends_with(base, "s") || ends_with(base, "x") || ends_with(base, "z") ||
        ends_with(base, "ch") || ends_with(base, "sh") || ends_with(base, "o")) {
        return base + "es";
    }
    if (base.size() > 1 && base.back() == 'y' && !is_vowel(base[base.size() - 2])) {
        return base.substr(0, base.size() - 1) + "ies";
    }
    return base + "s";
}

std::string VerbForms::present_participle(const std::string& base) {
    auto irr = irregulars().find(base);
    if (irr != irregulars().end() && !irr->second.participle.empty()) {
        return irr->second.participle;
    }
    if (ends_with(base, "ie")) {
        return base.substr(0, base.size() - 2) + "ying";
    }
    if (base.size() > 2 && base.back() == 'e' &&
        !ends_with(base, "ee") && !ends_with(base, "ye") && !ends_with(base, "oe")) {
        return base.substr(0, base.size() - 1) + "ing";
    }
    if (doubles_final_consonant(base)) {
        return base + base.back() + "ing";
    }
    return base + "ing";
}

std::string VerbForms::past(const std::string& base) {
    auto irr = irregulars().find(base);
    if (irr != irregulars().end() && !irr->second.past_forms.empty()) {
        return irr->second.past_forms.front();
    }
    if (base.back() == 'e') {
        return base + "d";
    }
    if (base.size() > 1 && base.back() == 'y' && !is_vowel(base[base.size() - 2])) {
        return base.substr(0, base.size() - 1) + "ied";
    }
    if (doubles_final_consonant(base)) {
        return base + base.back() + "ed";
    }
    return base + "ed";
}

std::set<std::string> VerbForms::generate(const std::string& base) {
    std::set<std::string> out;
    if (base.empty()) return out;

    out.insert(base);
    out.insert(third_person(base));
    out.insert(present_participle(base));

    auto irr = irregulars().find(base);
    if (irr != irregulars().end()) {
        out.insert(irr->second.past_forms.begin(), irr->second.past_forms.end());
    } else {
        out.insert(past(base));
    }
    return out;
}

const std::set<std::string>& VerbForms::forms(const std::string& base) {
    std::lock_guard<std::mutex> lock(cache_mutex_);
    auto it = cache_.find(base);
    if (it == cache_.end()) {
        it = cache_.emplace(base, generate(base)).first;
    }
    return it->second;
}

} // namespace promptspan
