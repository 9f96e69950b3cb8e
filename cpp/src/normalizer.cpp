// faraid/cpp/src/normalizer.cpp
#include "faraid/normalizer.h"

#include <unordered_map>
#include <utility>

#include "text_common.h"

namespace faraid {

namespace {

using R = Relationship;

const std::unordered_map<std::string, Relationship>& canonical_labels() {
    static const std::unordered_map<std::string, Relationship> m = {
        {"husband", R::Husband},
        {"wife", R::Wife},
        {"wives", R::Wife},
        {"father", R::Father},
        {"dad", R::Father},
        {"mother", R::Mother},
        {"mom", R::Mother},
        {"mum", R::Mother},
        {"son", R::Son},
        {"daughter", R::Daughter},

        {"grandson", R::Grandson},
        {"paternal grandson", R::Grandson},
        {"sons son", R::Grandson},
        {"son of son", R::Grandson},
        {"son of a son", R::Grandson},
        {"granddaughter", R::Granddaughter},
        {"paternal granddaughter", R::Granddaughter},
        {"sons daughter", R::Granddaughter},
        {"daughter of son", R::Granddaughter},
        {"daughter of a son", R::Granddaughter},

        {"grandfather", R::Grandfather},
        {"paternal grandfather", R::Grandfather},
        {"grandfather paternal", R::Grandfather},
        {"fathers father", R::Grandfather},
        {"grandmother", R::Grandmother},
        {"paternal grandmother", R::Grandmother},
        {"maternal grandmother", R::Grandmother},
        {"grandmother paternal", R::Grandmother},
        {"grandmother maternal", R::Grandmother},
        {"fathers mother", R::Grandmother},
        {"mothers mother", R::Grandmother},

        {"brother", R::FullBrother},
        {"full brother", R::FullBrother},
        {"brother full", R::FullBrother},
        {"germane brother", R::FullBrother},
        {"sister", R::FullSister},
        {"full sister", R::FullSister},
        {"sister full", R::FullSister},
        {"germane sister", R::FullSister},

        {"consanguine brother", R::ConsanguineBrother},
        {"brother consanguine", R::ConsanguineBrother},
        {"paternal brother", R::ConsanguineBrother},
        {"paternal half brother", R::ConsanguineBrother},
        {"half brother paternal", R::ConsanguineBrother},
        {"consanguine sister", R::ConsanguineSister},
        {"sister consanguine", R::ConsanguineSister},
        {"paternal sister", R::ConsanguineSister},
        {"paternal half sister", R::ConsanguineSister},
        {"half sister paternal", R::ConsanguineSister},

        {"uterine brother", R::UterineBrother},
        {"brother uterine", R::UterineBrother},
        {"maternal brother", R::UterineBrother},
        {"maternal half brother", R::UterineBrother},
        {"half brother maternal", R::UterineBrother},
        {"uterine sister", R::UterineSister},
        {"sister uterine", R::UterineSister},
        {"maternal sister", R::UterineSister},
        {"maternal half sister", R::UterineSister},
        {"half sister maternal", R::UterineSister},

        {"nephew", R::FullNephew},
        {"full nephew", R::FullNephew},
        {"nephew full", R::FullNephew},
        {"brothers son", R::FullNephew},
        {"full brothers son", R::FullNephew},
        {"son of brother", R::FullNephew},
        {"son of full brother", R::FullNephew},
    };
    return m;
}

// Generic labels that need gender (or the heir group) to pick a side.
struct GenericPair {
    Relationship male;
    Relationship female;
};

const std::unordered_map<std::string, GenericPair>& generic_labels() {
    static const std::unordered_map<std::string, GenericPair> m = {
        {"spouse", {R::Husband, R::Wife}},
        {"child", {R::Son, R::Daughter}},
        {"children", {R::Son, R::Daughter}},
        {"offspring", {R::Son, R::Daughter}},
        {"grandchild", {R::Grandson, R::Granddaughter}},
        {"grandchildren", {R::Grandson, R::Granddaughter}},
        {"paternal grandchild", {R::Grandson, R::Granddaughter}},
        {"sons child", {R::Grandson, R::Granddaughter}},
        {"parent", {R::Father, R::Mother}},
        {"grandparent", {R::Grandfather, R::Grandmother}},
        {"sibling", {R::FullBrother, R::FullSister}},
        {"full sibling", {R::FullBrother, R::FullSister}},
        {"consanguine sibling", {R::ConsanguineBrother, R::ConsanguineSister}},
        {"paternal sibling", {R::ConsanguineBrother, R::ConsanguineSister}},
        {"paternal half sibling", {R::ConsanguineBrother, R::ConsanguineSister}},
        {"half sibling paternal", {R::ConsanguineBrother, R::ConsanguineSister}},
        {"uterine sibling", {R::UterineBrother, R::UterineSister}},
        {"maternal sibling", {R::UterineBrother, R::UterineSister}},
        {"maternal half sibling", {R::UterineBrother, R::UterineSister}},
        {"half sibling maternal", {R::UterineBrother, R::UterineSister}},
    };
    return m;
}

// Recognized relatives that never inherit as sharers or residuaries here.
const std::unordered_map<std::string, const char*>& distant_kindred_labels() {
    static const std::unordered_map<std::string, const char*> m = {
        {"maternal grandfather", "maternal grandfather"},
        {"grandfather maternal", "maternal grandfather"},
        {"mothers father", "maternal grandfather"},
        {"daughters son", "daughter's child"},
        {"daughters daughter", "daughter's child"},
        {"daughters child", "daughter's child"},
        {"daughters children", "daughter's child"},
        {"son of daughter", "daughter's child"},
        {"daughter of daughter", "daughter's child"},
        {"sisters son", "sister's child"},
        {"sisters daughter", "sister's child"},
        {"sisters child", "sister's child"},
        {"sisters children", "sister's child"},
        {"brothers daughter", "brother's daughter"},
        {"uterine nephew", "uterine brother's child"},
        {"maternal nephew", "uterine brother's child"},
        {"maternal uncle", "maternal uncle"},
        {"uncle maternal", "maternal uncle"},
        {"distant kindred", "distant kindred"},
        {"dhawu al arham", "distant kindred"},
        {"dhawil arham", "distant kindred"},
    };
    return m;
}

bool is_digits(std::string_view t) {
    if (t.empty()) return false;
    for (char c : t) {
        if (c < '0' || c > '9') return false;
    }
    return true;
}

// "Wife 2" -> "wife", "Full Sisters" -> "full sisters"
std::string lookup_key(const std::vector<std::string_view>& tokens) {
    std::string key;
    for (auto t : tokens) {
        if (is_digits(t)) continue;
        if (!key.empty()) key.push_back(' ');
        key.append(t.data(), t.size());
    }
    return key;
}

// "full sisters" -> "full sister"
std::string singular_key(const std::string& key) {
    if (key.size() > 3 && key.back() == 's' && key[key.size() - 2] != 's') {
        return key.substr(0, key.size() - 1);
    }
    return key;
}

const char* barred_reason(const std::vector<std::string_view>& tokens) {
    for (auto t : tokens) {
        if (starts_with(t, "step")) return "step relations do not inherit";
        if (starts_with(t, "adopt")) return "adopted relations do not inherit";
        if (starts_with(t, "foster") || t == "milk") return "foster relations do not inherit";
        if (t == "illegitimate" || t == "wedlock") return "illegitimate relation does not inherit through the father";
    }
    if (has_token(tokens, "in") && has_token(tokens, "law")) return "in-law relations do not inherit";
    return nullptr;
}

const char* distant_reason(const std::string& key, const std::vector<std::string_view>& tokens) {
    const auto& m = distant_kindred_labels();
    auto it = m.find(key);
    if (it == m.end()) it = m.find(singular_key(key));
    if (it != m.end()) return it->second;

    for (auto t : tokens) {
        if (starts_with(t, "aunt")) return "aunt";
        if (starts_with(t, "niece")) return "niece";
    }
    return nullptr;
}

template <class Map>
auto find_label(const Map& m, const std::string& key) -> decltype(m.begin()) {
    auto it = m.find(key);
    if (it != m.end()) return it;
    return m.find(singular_key(key));
}

Classification excluded(Gender g, bool unmapped, std::string reason) {
    Classification c;
    c.relationship = Relationship::Excluded;
    c.gender = g;
    c.unmapped = unmapped;
    c.reason = std::move(reason);
    return c;
}

} // namespace

Gender parse_gender(std::string_view raw) {
    const std::string g = normalize_label(raw);
    if (g == "male" || g == "m" || g == "man" || g == "boy") return Gender::Male;
    if (g == "female" || g == "f" || g == "woman" || g == "girl") return Gender::Female;
    return Gender::Unknown;
}

Gender gender_from_group(std::string_view group) {
    static const char* const kMale[] = {
        "husband", "husbands", "son", "sons", "grandson", "grandsons", "father", "grandfather",
        "brother", "brothers", "nephew", "nephews", "male", "males", "men", "boys",
    };
    static const char* const kFemale[] = {
        "wife", "wives", "daughter", "daughters", "granddaughter", "granddaughters", "mother",
        "grandmother", "grandmothers", "sister", "sisters", "female", "females", "women", "girls",
    };

    const std::string norm = normalize_label(group);
    const auto tokens = label_tokens(norm);

    bool male = false;
    bool female = false;
    for (const char* t : kMale) male = male || has_token(tokens, t);
    for (const char* t : kFemale) female = female || has_token(tokens, t);

    if (male == female) return Gender::Unknown;
    return male ? Gender::Male : Gender::Female;
}

Classification classify_heir(const Heir& h) {
    const Gender gender = parse_gender(h.gender);

    const std::string norm = normalize_label(h.relationship);
    const auto tokens = label_tokens(norm);
    const std::string key = lookup_key(tokens);

    if (key.empty()) {
        return excluded(gender, true, "empty relationship label");
    }

    if (const char* why = barred_reason(tokens)) {
        return excluded(gender, false, why);
    }
    if (const char* who = distant_reason(key, tokens)) {
        return excluded(gender, false, std::string("distant kindred (") + who + ") does not inherit");
    }

    const auto& canon = canonical_labels();
    auto it = find_label(canon, key);
    if (it != canon.end()) {
        Classification c;
        c.relationship = it->second;
        c.gender = gender;
        return c;
    }

    const auto& generic = generic_labels();
    auto git = find_label(generic, key);
    if (git != generic.end()) {
        Gender side = gender;
        if (side == Gender::Unknown) side = gender_from_group(h.heir_group);
        if (side == Gender::Unknown) {
            return excluded(gender, true,
                            "ambiguous relationship '" + h.relationship + "': gender or heir group required");
        }
        Classification c;
        c.relationship = (side == Gender::Male) ? git->second.male : git->second.female;
        c.gender = side;
        return c;
    }

    return excluded(gender, true, "unrecognized relationship '" + h.relationship + "'");
}

std::vector<NormalizedHeir> normalize_roster(const std::vector<Heir>& heirs) {
    std::vector<NormalizedHeir> out;
    out.reserve(heirs.size());

    for (const auto& h : heirs) {
        Classification c = classify_heir(h);
        NormalizedHeir n;
        n.heir = h;
        n.relationship = c.relationship;
        n.gender = c.gender;
        n.unmapped = c.unmapped;
        n.reason = std::move(c.reason);
        out.push_back(std::move(n));
    }
    return out;
}

std::vector<AuditEntry> audit_roster(const std::vector<Heir>& heirs) {
    std::vector<AuditEntry> out;
    out.reserve(heirs.size());
    for (const auto& h : heirs) {
        Classification c = classify_heir(h);
        AuditEntry e;
        e.id = h.id;
        e.raw = h.relationship;
        e.canonical = c.relationship;
        e.gender = c.gender;
        e.unmapped = c.unmapped;
        e.reason = std::move(c.reason);
        out.push_back(std::move(e));
    }
    return out;
}

} // namespace faraid
