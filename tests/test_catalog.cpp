// test_catalog.cpp – Object library loading and lookup.
//
// Compile with CMake:
//   cmake -B build && cmake --build build
//   ./build/test_catalog specs/dnp3_objects.xml

#include "DNP3Codec/Catalog.hpp"

#include <cstdint>
#include <filesystem>
#include <iostream>
#include <string>
#include <vector>

namespace fs = std::filesystem;
using namespace dnp3;

static int failures = 0;

#define CHECK(cond, msg)                                                  \
    do {                                                                   \
        if (!(cond)) {                                                     \
            std::cerr << "FAIL [" << __LINE__ << "] " << (msg) << '\n';  \
            ++failures;                                                    \
        } else {                                                           \
            std::cout << "OK   " << (msg) << '\n';                        \
        }                                                                  \
    } while(0)

// ─────────────────────────────────────────────────────────────────────────────
//  Test 1: the shipped object library loads
// ─────────────────────────────────────────────────────────────────────────────
static bool testLoad(VariationCatalog& out, const fs::path& path) {
    std::cout << "\n=== Test: Object library load ===\n";
    try {
        VariationCatalog catalog = loadCatalog(path);
        CHECK(catalog.name() == "DNP3",        "library name = DNP3");
        CHECK(!catalog.edition().empty(),      "edition present");
        // 4 octet-string groups × 256 variations plus the fixed table
        CHECK(catalog.size() > 4 * 256,        "catalog holds octet groups and fixed variations");
        out = std::move(catalog);
        return true;
    } catch (const std::exception& e) {
        std::cerr << "FAIL object library load: " << e.what() << '\n';
        ++failures;
        return false;
    }
}

// ─────────────────────────────────────────────────────────────────────────────
//  Test 2: lookups return the declared shape and size
// ─────────────────────────────────────────────────────────────────────────────
static void testLookupShapes(const VariationCatalog& catalog) {
    std::cout << "\n=== Test: Lookup shapes ===\n";

    const Variation* g1v1 = catalog.lookup(1, 1);
    CHECK(g1v1 && g1v1->shape == Shape::SingleBitField, "g1v1 is a single-bit field");

    const Variation* g3v1 = catalog.lookup(3, 1);
    CHECK(g3v1 && g3v1->shape == Shape::DoubleBitField, "g3v1 is a double-bit field");

    const Variation* g30v1 = catalog.lookup(GroupVar{30, 1});
    CHECK(g30v1 != nullptr, "g30v1 present");
    if (g30v1) {
        CHECK(g30v1->shape == Shape::FixedSize,              "g30v1 fixed");
        CHECK(g30v1->record_size == 5,                       "g30v1 record = 5 bytes");
        CHECK(g30v1->name == "AnalogInput.Int32WithFlag",    "g30v1 name");
        CHECK(g30v1->group_type == GroupType::Static,        "g30v1 static group");
        CHECK(g30v1->fields.size() == 2,                     "g30v1 has 2 fields");
        CHECK(g30v1->id().toString() == "g30v1",             "g30v1 text form");
    }

    const Variation* g60v2 = catalog.lookup(60, 2);
    CHECK(g60v2 && g60v2->shape == Shape::AnyVariation,      "g60v2 any variation");
    CHECK(g60v2 && g60v2->group_type == GroupType::Class,    "g60 is class data");

    const Variation* g110v0 = catalog.lookup(110, 0);
    CHECK(g110v0 && g110v0->shape == Shape::SizedByVariation, "g110v0 sized by variation");
    CHECK(g110v0 && g110v0->record_size == 0,                 "g110v0 has no length");

    const Variation* g110v255 = catalog.lookup(110, 255);
    CHECK(g110v255 && g110v255->record_size == 255,           "g110v255 = 255-byte items");

    const Variation* g12v1 = catalog.lookup(12, 1);
    CHECK(g12v1 && g12v1->record_size == 11,                  "g12v1 CROB = 11 bytes");
    if (g12v1 && g12v1->fields.size() == 5) {
        const FieldDef& status = g12v1->fields[4];
        CHECK(status.encoding == FieldEncoding::Table,        "CROB status uses a table");
        CHECK(status.table.count(4) && status.table.at(4) == "NotSupported",
              "command_status table entry 4");
    }

    CHECK(catalog.lookup(30, 99) == nullptr,  "g30v99 not defined");
    CHECK(catalog.lookup(200, 1) == nullptr,  "group 200 not defined");
    CHECK(catalog.lookup(0, 0) == nullptr,    "g0v0 not defined");
}

// ─────────────────────────────────────────────────────────────────────────────
//  Test 3: fixed record widths agree with IEEE 1815
// ─────────────────────────────────────────────────────────────────────────────
static void testFixedSizes(const VariationCatalog& catalog) {
    std::cout << "\n=== Test: Fixed record sizes ===\n";

    struct Expect { uint8_t g, v; uint16_t size; };
    const std::vector<Expect> expected = {
        {1, 2, 1},   {2, 1, 1},   {2, 2, 7},   {2, 3, 3},
        {3, 2, 1},   {4, 2, 7},   {10, 2, 1},  {11, 2, 7},
        {12, 2, 11}, {13, 2, 7},
        {20, 1, 5},  {20, 2, 3},  {20, 5, 4},  {20, 6, 2},
        {21, 5, 11}, {21, 6, 9},  {21, 9, 4},  {21, 10, 2},
        {22, 5, 11}, {23, 6, 9},
        {30, 2, 3},  {30, 3, 4},  {30, 4, 2},  {30, 5, 5},  {30, 6, 9},
        {31, 3, 11}, {31, 8, 9},
        {32, 3, 11}, {32, 7, 11}, {32, 8, 15}, {33, 4, 9},
        {34, 1, 2},  {34, 2, 4},  {34, 3, 4},
        {40, 1, 5},  {40, 4, 9},
        {41, 1, 5},  {41, 2, 3},  {41, 3, 5},  {41, 4, 9},
        {42, 8, 15}, {43, 1, 5},  {43, 8, 15},
        {50, 1, 6},  {50, 4, 11}, {51, 1, 6},  {52, 2, 2},
        {102, 1, 1},
    };

    for (const auto& e : expected) {
        const Variation* v = catalog.lookup(e.g, e.v);
        const std::string id = GroupVar{e.g, e.v}.toString();
        CHECK(v && v->shape == Shape::FixedSize && v->record_size == e.size,
              id + " record = " + std::to_string(e.size) + " bytes");
    }
}

// ─────────────────────────────────────────────────────────────────────────────
//  Test 4: range-qualifier eligibility
// ─────────────────────────────────────────────────────────────────────────────
static void testRangeEligibility(const VariationCatalog& catalog) {
    std::cout << "\n=== Test: Range qualifier eligibility ===\n";

    auto allows = [&](uint8_t g, uint8_t v) {
        const Variation* var = catalog.lookup(g, v);
        return var && var->allowsRangeQualifier();
    };

    CHECK(allows(1, 0),    "g1v0 (static any) allowed");
    CHECK(allows(1, 2),    "g1v2 (static fixed) allowed");
    CHECK(allows(80, 1),   "g80v1 (IIN bits) allowed");
    CHECK(allows(12, 3),   "g12v3 (pattern mask bits) allowed");
    CHECK(allows(110, 0),  "g110v0 (static octet) allowed");
    CHECK(allows(110, 9),  "g110v9 (static octet) allowed");
    CHECK(!allows(2, 1),   "g2v1 (event) rejected");
    CHECK(!allows(2, 0),   "g2v0 (event any) rejected");
    CHECK(!allows(12, 1),  "g12v1 (command) rejected");
    CHECK(!allows(50, 1),  "g50v1 (time) rejected");
    CHECK(!allows(60, 1),  "g60v1 (class) rejected");
    CHECK(!allows(111, 4), "g111v4 (event octet) rejected");
}

// ─────────────────────────────────────────────────────────────────────────────
//  Test 5: in-memory documents and schema violations
// ─────────────────────────────────────────────────────────────────────────────
static void testFromString() {
    std::cout << "\n=== Test: Load from string ===\n";

    const char* xml = R"(
        <ObjectLibrary name="Mini" edition="test">
          <Group id="20" name="Counter" type="static">
            <Variation id="1" name="Count32WithFlag" shape="fixed">
              <Field name="flags" type="u8" encoding="hex"/>
              <Field name="value" type="u32"/>
            </Variation>
            <Variation id="7" name="Opaque" shape="fixed" size="3"/>
          </Group>
        </ObjectLibrary>)";

    try {
        VariationCatalog c = loadCatalogFromString(xml);
        CHECK(c.size() == 2,                       "two variations");
        CHECK(c.name() == "Mini",                  "identity name");
        const Variation* v = c.lookup(20, 1);
        CHECK(v && v->record_size == 5,            "size from fields");
        const Variation* o = c.lookup(20, 7);
        CHECK(o && o->record_size == 3 && o->fields.empty(), "size without fields");
    } catch (const std::exception& e) {
        std::cerr << "FAIL load from string: " << e.what() << '\n';
        ++failures;
    }
}

static void expectLoadError(const std::string& body, const std::string& what) {
    const std::string xml = "<ObjectLibrary name=\"Bad\">" + body + "</ObjectLibrary>";
    bool threw = false;
    try {
        (void)loadCatalogFromString(xml);
    } catch (const CatalogLoadError& e) {
        threw = true;
        std::cout << "     (" << e.what() << ")\n";
    }
    CHECK(threw, "rejects " + what);
}

static void testSchemaErrors() {
    std::cout << "\n=== Test: Schema violations ===\n";

    bool threw = false;
    try { (void)loadCatalogFromString("<Nope/>"); }
    catch (const CatalogLoadError&) { threw = true; }
    CHECK(threw, "rejects wrong root element");

    threw = false;
    try { (void)loadCatalogFromString("<ObjectLibrary"); }
    catch (const CatalogLoadError&) { threw = true; }
    CHECK(threw, "rejects malformed XML");

    threw = false;
    try { (void)loadCatalog("/nonexistent/dnp3_objects.xml"); }
    catch (const CatalogLoadError&) { threw = true; }
    CHECK(threw, "rejects missing file");

    expectLoadError("", "empty library");
    expectLoadError(R"(<Group id="1" name="A" type="static">
                         <Variation id="1" name="X" shape="triple_bit"/></Group>)",
                    "unknown shape");
    expectLoadError(R"(<Group id="1" name="A" type="stable"/>)", "unknown group type");
    expectLoadError(R"(<Group id="1" name="A" type="static">
                         <Variation id="1" name="X" shape="bit"/>
                         <Variation id="1" name="Y" shape="bit"/></Group>)",
                    "duplicate variation");
    expectLoadError(R"(<Group id="1" name="A" type="static">
                         <Variation id="2" name="X" shape="fixed" size="4">
                           <Field name="flags" type="u8"/></Variation></Group>)",
                    "size disagreeing with fields");
    expectLoadError(R"(<Group id="1" name="A" type="static">
                         <Variation id="2" name="X" shape="fixed"/></Group>)",
                    "fixed variation without size");
    expectLoadError(R"(<Group id="0" name="A" type="static">
                         <Variation id="1" name="X" shape="bit"/></Group>)",
                    "group id zero");
    expectLoadError(R"(<Group id="1" name="A" type="static">
                         <Variation id="256" name="X" shape="bit"/></Group>)",
                    "variation id above 255");
    expectLoadError(R"(<Group id="1" name="A" type="static">
                         <Variation id="2" name="X" shape="fixed">
                           <Field name="s" type="u8" table="missing"/></Variation></Group>)",
                    "unknown table reference");
    expectLoadError(R"(<Group id="1" name="A" type="static">
                         <Variation id="2" name="X" shape="fixed">
                           <Field name="t" type="u16" encoding="timestamp"/></Variation></Group>)",
                    "timestamp on a 16-bit field");
    expectLoadError(R"(<Group id="1" name="A" type="static">
                         <Variation id="2" name="X" shape="fixed">
                           <Field name="c" type="u16" encoding="control_code"/></Variation></Group>)",
                    "control_code on a 16-bit field");
    expectLoadError(R"(<Group id="1" name="A" type="static">
                         <Variation id="2" name="X" shape="fixed">
                           <Field name="v" type="u24"/></Variation></Group>)",
                    "unknown field type");
    expectLoadError(R"(<Group id="1" name="A" type="static">
                         <Variation id="1" name="X" shape="bit">
                           <Field name="v" type="u8"/></Variation></Group>)",
                    "fields on a packed variation");
    expectLoadError(R"(<Group id="110" name="O" type="static" sized_by_variation="true">
                         <Variation id="1" name="X" shape="fixed" size="1"/></Group>)",
                    "variations inside a sized-by-variation group");
}

// ─────────────────────────────────────────────────────────────────────────────
//  main
// ─────────────────────────────────────────────────────────────────────────────
int main(int argc, char* argv[]) {
    fs::path spec_path = (argc > 1)
        ? fs::path(argv[1])
        : fs::path(__FILE__).parent_path().parent_path() / "specs" / "dnp3_objects.xml";

    std::cout << "Using object library: " << spec_path << '\n';

    VariationCatalog catalog;
    if (testLoad(catalog, spec_path)) {
        testLookupShapes(catalog);
        testFixedSizes(catalog);
        testRangeEligibility(catalog);
    }
    testFromString();
    testSchemaErrors();

    std::cout << "\n──────────────────────────────────\n";
    if (failures == 0) {
        std::cout << "ALL TESTS PASSED\n";
    } else {
        std::cout << failures << " TEST(S) FAILED\n";
    }
    return failures == 0 ? 0 : 1;
}
