#include <plugins/mongodb_references.hpp>
#include <algorithm>
#include <cctype>
#include <map>

namespace Omnidb {

namespace {

std::string lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

bool ends_with(const std::string& s, const std::string& suffix) {
    return s.size() > suffix.size() && s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

// camelCase suffix: the character before it must not be upper-case ("userId", not "UID").
bool camel_suffix(const std::string& s, const std::string& suffix) {
    if (!ends_with(s, suffix)) return false;
    unsigned char before = static_cast<unsigned char>(s[s.size() - suffix.size() - 1]);
    return std::islower(before) || std::isdigit(before);
}

class Linker {
public:
    explicit Linker(const std::vector<CollectionSample>& samples) {
        for (const auto& sample : samples) {
            index_.emplace(sample.unit.name, graph_.size());
            graph_.push_back({sample.unit, {}});
        }
    }

    void link(const std::string& from, const std::string& to, RelationshipType type) {
        auto it = index_.find(from);
        if (it == index_.end()) return;
        auto& relations = graph_[it->second].relations;
        GraphUnitRelationship rel{to, type};
        if (std::find(relations.begin(), relations.end(), rel) == relations.end()) relations.push_back(rel);
    }

    std::vector<GraphUnit> take() { return std::move(graph_); }

private:
    std::vector<GraphUnit> graph_;
    std::map<std::string, size_t> index_;
};

} // namespace

std::string reference_base(const std::string& field, bool& many) {
    many = false;
    if (field == "_id") return {};

    if (ends_with(field, "_ids")) {
        many = true;
        return field.substr(0, field.size() - 4);
    }
    if (camel_suffix(field, "Ids")) {
        many = true;
        return field.substr(0, field.size() - 3);
    }
    if (ends_with(field, "_id")) return field.substr(0, field.size() - 3);
    if (camel_suffix(field, "Id")) return field.substr(0, field.size() - 2);
    return {};
}

std::string match_collection(const std::string& base, const std::vector<std::string>& collections) {
    if (base.empty()) return {};
    const std::string b = lower(base);

    std::vector<std::string> forms = {b, b + "s", b + "es"};
    if (b.size() > 1 && b.back() == 'y') forms.push_back(b.substr(0, b.size() - 1) + "ies");

    for (const auto& name : collections) {
        const std::string n = lower(name);
        if (std::find(forms.begin(), forms.end(), n) != forms.end()) return name;
    }
    return {};
}

std::vector<GraphUnit> infer_references(const std::vector<CollectionSample>& samples) {
    std::vector<std::string> names;
    names.reserve(samples.size());
    for (const auto& sample : samples) names.push_back(sample.unit.name);

    Linker linker(samples);
    for (const auto& sample : samples) {
        for (const auto& field : sample.fields) {
            bool many = false;
            std::string target = match_collection(reference_base(field, many), names);
            if (target.empty()) continue;

            if (many || sample.array_fields.count(field)) {
                linker.link(sample.unit.name, target, RelationshipType::ManyToMany);
                linker.link(target, sample.unit.name, RelationshipType::ManyToMany);
            } else if (sample.unique_fields.count(field)) {
                linker.link(sample.unit.name, target, RelationshipType::OneToOne);
                linker.link(target, sample.unit.name, RelationshipType::OneToOne);
            } else {
                linker.link(sample.unit.name, target, RelationshipType::ManyToOne);
                linker.link(target, sample.unit.name, RelationshipType::OneToMany);
            }
        }
    }
    return linker.take();
}

} // namespace Omnidb
