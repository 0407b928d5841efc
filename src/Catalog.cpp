// Catalog.cpp – Parses the DNP3 object library XML into a VariationCatalog.
// Uses pugixml for robust, zero-copy XML parsing.

#include "DNP3Codec/Catalog.hpp"

#include <pugixml.hpp>

#include <charconv>
#include <cstring>
#include <map>
#include <string>

namespace dnp3 {

// ─────────────────────────────────────────────────────────────────────────────
//  Catalog registry
// ─────────────────────────────────────────────────────────────────────────────

void VariationCatalog::add(Variation v) {
    const GroupVar key = v.id();
    auto [it, inserted] = variations_.try_emplace(key, std::move(v));
    if (!inserted)
        throw CatalogLoadError("Duplicate variation " + key.toString());
}

const Variation* VariationCatalog::lookup(uint8_t group, uint8_t variation) const noexcept {
    auto it = variations_.find(GroupVar{group, variation});
    return it == variations_.end() ? nullptr : &it->second;
}

const char* groupTypeName(GroupType t) noexcept {
    switch (t) {
    case GroupType::Static:  return "static";
    case GroupType::Event:   return "event";
    case GroupType::Command: return "command";
    case GroupType::Class:   return "class";
    case GroupType::Time:    return "time";
    case GroupType::Iin:     return "iin";
    case GroupType::Other:   return "other";
    }
    return "unknown";
}

// ─── Small parsing helpers ────────────────────────────────────────────────────

using TableMap = std::map<std::string, std::map<uint64_t, std::string>>;

static uint64_t parseU64(const char* s, const char* ctx) {
    uint64_t v = 0;
    auto [ptr, ec] = std::from_chars(s, s + std::strlen(s), v);
    if (ec != std::errc{} || ptr != s + std::strlen(s))
        throw CatalogLoadError(std::string(ctx) + ": cannot parse uint '" + s + "'");
    return v;
}

static uint8_t parseU8(const char* s, const char* ctx) {
    const uint64_t v = parseU64(s, ctx);
    if (v > 255)
        throw CatalogLoadError(std::string(ctx) + ": value " + s + " exceeds 255");
    return static_cast<uint8_t>(v);
}

static GroupType parseGroupType(const char* s) {
    if (!s || *s == '\0')              return GroupType::Other;
    if (strcmp(s, "static")  == 0)     return GroupType::Static;
    if (strcmp(s, "event")   == 0)     return GroupType::Event;
    if (strcmp(s, "command") == 0)     return GroupType::Command;
    if (strcmp(s, "class")   == 0)     return GroupType::Class;
    if (strcmp(s, "time")    == 0)     return GroupType::Time;
    if (strcmp(s, "iin")     == 0)     return GroupType::Iin;
    if (strcmp(s, "other")   == 0)     return GroupType::Other;
    throw CatalogLoadError(std::string("Unknown group type: '") + s + "'");
}

static Shape parseShape(const char* s) {
    if (strcmp(s, "any")                == 0) return Shape::AnyVariation;
    if (strcmp(s, "bit")                == 0) return Shape::SingleBitField;
    if (strcmp(s, "double_bit")         == 0) return Shape::DoubleBitField;
    if (strcmp(s, "fixed")              == 0) return Shape::FixedSize;
    if (strcmp(s, "sized_by_variation") == 0) return Shape::SizedByVariation;
    throw CatalogLoadError(std::string("Unknown shape: '") + s + "'");
}

static FieldType parseFieldType(const char* s) {
    if (strcmp(s, "u8")  == 0) return FieldType::U8;
    if (strcmp(s, "u16") == 0) return FieldType::U16;
    if (strcmp(s, "u32") == 0) return FieldType::U32;
    if (strcmp(s, "u48") == 0) return FieldType::U48;
    if (strcmp(s, "i16") == 0) return FieldType::I16;
    if (strcmp(s, "i32") == 0) return FieldType::I32;
    if (strcmp(s, "f32") == 0) return FieldType::F32;
    if (strcmp(s, "f64") == 0) return FieldType::F64;
    throw CatalogLoadError(std::string("Unknown field type: '") + s + "'");
}

static FieldEncoding parseEncoding(const char* s) {
    if (!s || *s == '\0')                return FieldEncoding::Raw;
    if (strcmp(s, "raw")       == 0)     return FieldEncoding::Raw;
    if (strcmp(s, "hex")       == 0)     return FieldEncoding::Hex;
    if (strcmp(s, "timestamp") == 0)     return FieldEncoding::Timestamp;
    if (strcmp(s, "control_code") == 0)  return FieldEncoding::ControlCode;
    throw CatalogLoadError(std::string("Unknown encoding: '") + s + "'");
}

// ─── Parse the <Tables> block ─────────────────────────────────────────────────

static TableMap parseTables(pugi::xml_node node) {
    TableMap tables;
    for (auto table_node : node.children("Table")) {
        std::string id = table_node.attribute("id").as_string("");
        if (id.empty())
            throw CatalogLoadError("<Table> missing 'id' attribute");

        std::map<uint64_t, std::string> entries;
        for (auto entry : table_node.children("Entry")) {
            uint64_t    val  = parseU64(entry.attribute("value").as_string("0"), "Entry.value");
            std::string mean = entry.attribute("meaning").as_string("");
            entries[val]     = std::move(mean);
        }
        tables[std::move(id)] = std::move(entries);
    }
    return tables;
}

// ─── Parse a single <Field> node into a FieldDef ──────────────────────────────

static FieldDef parseField(pugi::xml_node node, const TableMap& tables,
                           const std::string& owner) {
    FieldDef f;
    f.name     = node.attribute("name").as_string("");
    f.type     = parseFieldType(node.attribute("type").as_string(""));
    f.encoding = parseEncoding(node.attribute("encoding").as_string("raw"));

    if (f.name.empty())
        throw CatalogLoadError(owner + ": <Field> missing 'name'");

    if (auto a = node.attribute("table"); a) {
        auto it = tables.find(a.as_string());
        if (it == tables.end())
            throw CatalogLoadError(owner + "." + f.name + ": unknown table '" +
                                   a.as_string() + "'");
        f.encoding = FieldEncoding::Table;
        f.table    = it->second;
    }

    if (f.encoding == FieldEncoding::Timestamp && f.type != FieldType::U48)
        throw CatalogLoadError(owner + "." + f.name + ": timestamp encoding requires u48");
    if (f.encoding == FieldEncoding::ControlCode && f.type != FieldType::U8)
        throw CatalogLoadError(owner + "." + f.name + ": control_code encoding requires u8");

    return f;
}

// ─── Parse one <Variation> node ───────────────────────────────────────────────

static Variation parseVariation(pugi::xml_node node, uint8_t group,
                                const std::string& group_name, GroupType group_type,
                                const TableMap& tables) {
    Variation v;
    v.group      = group;
    v.variation  = parseU8(node.attribute("id").as_string(""), "Variation.id");
    v.name       = group_name + "." + node.attribute("name").as_string("");
    v.group_type = group_type;
    v.shape      = parseShape(node.attribute("shape").as_string(""));

    const std::string owner = v.id().toString();

    uint32_t total_bytes = 0;
    for (auto field_node : node.children("Field")) {
        FieldDef f   = parseField(field_node, tables, owner);
        total_bytes += fieldWidth(f.type);
        v.fields.push_back(std::move(f));
    }

    if (v.shape == Shape::SizedByVariation)
        throw CatalogLoadError(owner + ": sized_by_variation is declared on the <Group>");

    if (v.shape != Shape::FixedSize) {
        if (!v.fields.empty() || node.attribute("size"))
            throw CatalogLoadError(owner + ": only fixed variations carry fields or a size");
        return v;
    }

    if (auto a = node.attribute("size"); a) {
        const uint64_t declared = parseU64(a.as_string(), "Variation.size");
        if (!v.fields.empty() && declared != total_bytes)
            throw CatalogLoadError(owner + ": size=" + std::to_string(declared) +
                                   " but fields sum to " + std::to_string(total_bytes));
        total_bytes = static_cast<uint32_t>(declared);
    }
    if (total_bytes == 0 || total_bytes > 0xFFFF)
        throw CatalogLoadError(owner + ": fixed variation needs a non-zero size");

    v.record_size = static_cast<uint16_t>(total_bytes);
    return v;
}

// ─── Parse one <Group> node ───────────────────────────────────────────────────

static void parseGroup(pugi::xml_node node, const TableMap& tables, VariationCatalog& catalog) {
    const uint8_t   group = parseU8(node.attribute("id").as_string(""), "Group.id");
    const std::string name = node.attribute("name").as_string("");
    const GroupType type  = parseGroupType(node.attribute("type").as_string("other"));

    if (group == 0)
        throw CatalogLoadError("<Group id=\"...\"> is missing or zero");
    if (name.empty())
        throw CatalogLoadError("Group " + std::to_string(group) + " missing 'name'");

    if (node.attribute("sized_by_variation").as_bool(false)) {
        if (node.child("Variation"))
            throw CatalogLoadError("Group " + std::to_string(group) +
                                   ": sized_by_variation groups list no <Variation>");
        // Variation number = item length; 0 means "length unspecified".
        for (unsigned x = 0; x <= 255; ++x) {
            Variation v;
            v.group       = group;
            v.variation   = static_cast<uint8_t>(x);
            v.name        = name + ".Var" + std::to_string(x);
            v.group_type  = type;
            v.shape       = Shape::SizedByVariation;
            v.record_size = static_cast<uint16_t>(x);
            catalog.add(std::move(v));
        }
        return;
    }

    for (auto var_node : node.children("Variation"))
        catalog.add(parseVariation(var_node, group, name, type, tables));
}

static VariationCatalog buildCatalog(const pugi::xml_document& doc) {
    pugi::xml_node root = doc.child("ObjectLibrary");
    if (!root)
        throw CatalogLoadError("XML root element must be <ObjectLibrary>");

    VariationCatalog catalog;
    catalog.setIdentity(root.attribute("name").as_string(""),
                        root.attribute("edition").as_string(""));

    TableMap tables;
    if (auto tables_node = root.child("Tables"))
        tables = parseTables(tables_node);

    for (auto group_node : root.children("Group"))
        parseGroup(group_node, tables, catalog);

    if (catalog.size() == 0)
        throw CatalogLoadError("Object library declares no variations");

    return catalog;
}

// ─── Public entry points ──────────────────────────────────────────────────────

VariationCatalog loadCatalog(const std::filesystem::path& xml_path) {
    pugi::xml_document doc;
    pugi::xml_parse_result result = doc.load_file(xml_path.c_str());
    if (!result)
        throw CatalogLoadError("Failed to parse XML '" + xml_path.string() +
                               "': " + result.description());
    return buildCatalog(doc);
}

VariationCatalog loadCatalogFromString(std::string_view xml) {
    pugi::xml_document doc;
    pugi::xml_parse_result result = doc.load_buffer(xml.data(), xml.size());
    if (!result)
        throw CatalogLoadError(std::string("Failed to parse XML: ") + result.description());
    return buildCatalog(doc);
}

} // namespace dnp3
