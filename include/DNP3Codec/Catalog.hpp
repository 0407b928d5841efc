#pragma once
// Catalog.hpp – The DNP3 object library: every (group, variation) the codec
// understands, loaded from an XML description.
//
// Usage example:
//   VariationCatalog catalog = loadCatalog("specs/dnp3_objects.xml");
//   if (const Variation* v = catalog.lookup(30, 1))
//       std::cout << v->name << " – " << v->record_size << " bytes\n";

#include "Types.hpp"

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <map>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

namespace dnp3 {

// Thrown when the XML is structurally invalid or violates the schema rules.
class CatalogLoadError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Read-only after loading; lookups may run concurrently from any thread.
// Variation pointers stay valid for the lifetime of the catalog, including
// across moves.
class VariationCatalog {
public:
    // Register a variation.  Throws CatalogLoadError on a duplicate identity.
    void add(Variation v);

    // nullptr when the object library defines no such variation.
    [[nodiscard]] const Variation* lookup(uint8_t group, uint8_t variation) const noexcept;
    [[nodiscard]] const Variation* lookup(GroupVar id) const noexcept {
        return lookup(id.group, id.variation);
    }

    [[nodiscard]] size_t size() const noexcept { return variations_.size(); }

    [[nodiscard]] const std::string& name()    const noexcept { return name_; }
    [[nodiscard]] const std::string& edition() const noexcept { return edition_; }

    void setIdentity(std::string name, std::string edition) {
        name_    = std::move(name);
        edition_ = std::move(edition);
    }

    [[nodiscard]] auto begin() const noexcept { return variations_.begin(); }
    [[nodiscard]] auto end()   const noexcept { return variations_.end(); }

private:
    std::map<GroupVar, Variation> variations_;
    std::string name_;
    std::string edition_;
};

// Loads the object library from the given XML file path.
// Throws CatalogLoadError on any parse or validation failure.
VariationCatalog loadCatalog(const std::filesystem::path& xml_path);

// Same, from an in-memory XML document.
VariationCatalog loadCatalogFromString(std::string_view xml);

} // namespace dnp3
