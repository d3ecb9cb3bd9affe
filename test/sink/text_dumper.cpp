#include "text_dumper.h"
#include "gtest/gtest.h"

#include <sstream>

using namespace heapgraph;
using namespace heapgraph::sink;

static ResolvedObject make_object(object_kind_t kind, object_id_t id, std::optional<std::string> class_name) {
    return ResolvedObject{
            .kind = kind,
            .id = id,
            .stack_trace_serial = 0,
            .class_id = 0x011,
            .class_name = std::move(class_name),
            .fields = {},
            .element_type = value_type_t::kObject,
            .elements = {},
            .references = {}
    };
}

TEST(text_dumper, instance) {
    ResolvedObject object = make_object(object_kind_t::kInstance, 1, "Foo");
    object.fields = {
            {.name = "x", .value = Value(value_type_t::kInt, 42), .referent_type = std::nullopt},
            {.name = "flag", .value = Value(value_type_t::kBoolean, 1), .referent_type = std::nullopt},
            {.name = "next", .value = Value::Reference(0), .referent_type = std::nullopt},
            {.name = "owner", .value = Value::Reference(7), .referent_type = "Bar"},
            {.name = "lost", .value = Value::Reference(8), .referent_type = std::nullopt},
            {.name = "anonymous", .value = Value::Reference(9), .referent_type = std::nullopt, .referent_found = true},
            {.name = std::nullopt, .value = Value(value_type_t::kByte, 0xff), .referent_type = std::nullopt},
    };

    std::ostringstream out;
    TextDumper dumper(out);
    dumper.Handle(ObjectResolved{.object = object});
    EXPECT_EQ("\nid 1: Foo\n"
              "  - x: int = 42\n"
              "  - flag: boolean = true\n"
              "  - next = null\n"
              "  - owner = id 7 (Bar)\n"
              "  - lost = id 8 (type for obj id not found)\n"
              "  - anonymous = id 9 (class not found)\n"
              "  - (missing utf8): byte = -1\n", out.str());
}

TEST(text_dumper, class_and_arrays) {
    std::ostringstream out;
    TextDumper dumper(out);

    dumper.Handle(ClassResolved{.resolved = ResolvedClass{
            .class_id = 0x011,
            .class_name = std::nullopt,
            .super_class_id = kNullObjectId,
            .instance_size = 0,
            .static_fields = {{.name = "COUNT", .value = Value(value_type_t::kLong, 3), .referent_type = std::nullopt}}
    }});

    ResolvedObject array = make_object(object_kind_t::kObjectArray, 2, std::nullopt);
    array.references = {
            {.id = 1, .referent_type = "Foo"},
            {.id = 0, .referent_type = std::nullopt},
            {.id = 9, .referent_type = std::nullopt},
    };
    dumper.Handle(ObjectResolved{.object = array});

    ResolvedObject bytes = make_object(object_kind_t::kPrimitiveArray, 3, "byte[]");
    bytes.element_type = value_type_t::kByte;
    bytes.elements = {Value(value_type_t::kByte, 0x0a), Value(value_type_t::kByte, 0xff)};
    dumper.Handle(ObjectResolved{.object = bytes});

    ResolvedObject chars = make_object(object_kind_t::kPrimitiveArray, 4, "char[]");
    chars.element_type = value_type_t::kChar;
    chars.elements = {Value(value_type_t::kChar, 65)};
    dumper.Handle(ObjectResolved{.object = chars});

    // Counting events print nothing.
    dumper.Handle(RecordCounted{.tag = record_tag_t::kUtf8, .timestamp = 0, .length = 0});

    EXPECT_EQ("\nid 17: class (missing utf8)\n"
              "  - COUNT: long = 3\n"
              "\nid 2: (class not found) = [\n"
              "  - id 1: Foo\n"
              "  - null\n"
              "  - id 9: (could not resolve class)\n"
              "]\n"
              "\n3: byte[] = [0xA, 0xFF, ]\n"
              "\n4: char[] = [65, ]\n", out.str());
}
