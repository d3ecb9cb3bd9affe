#include "include/text_dumper.h"

#include <cstdio>

namespace heapgraph::sink {

    static constexpr const char *kMissingUtf8 = "(missing utf8)";
    static constexpr const char *kClassNotFound = "(class not found)";
    static constexpr const char *kCouldNotResolveClass = "(could not resolve class)";
    static constexpr const char *kTypeNotFound = "(type for obj id not found)";

    static void print_value(std::ostream &out, const Value &value) {
        switch (value.GetType()) {
            case value_type_t::kObject:
                out << value.AsObjectId();
                break;
            case value_type_t::kBoolean:
                out << (value.AsBoolean() ? "true" : "false");
                break;
            case value_type_t::kChar:
                out << value.AsChar();
                break;
            case value_type_t::kFloat:
                out << value.AsFloat();
                break;
            case value_type_t::kDouble:
                out << value.AsDouble();
                break;
            case value_type_t::kByte:
                out << static_cast<int>(value.AsByte());
                break;
            case value_type_t::kShort:
                out << value.AsShort();
                break;
            case value_type_t::kInt:
                out << value.AsInt();
                break;
            case value_type_t::kLong:
                out << value.AsLong();
                break;
        }
    }

    TextDumper::TextDumper(std::ostream &out) : out_(out) {}

    void TextDumper::Handle(const event_t &event) {
        if (const auto *class_resolved = std::get_if<ClassResolved>(&event)) {
            DumpClass(class_resolved->resolved);
        } else if (const auto *object_resolved = std::get_if<ObjectResolved>(&event)) {
            const ResolvedObject &object = object_resolved->object;
            switch (object.kind) {
                case object_kind_t::kInstance:
                    DumpInstance(object);
                    break;
                case object_kind_t::kObjectArray:
                    DumpObjectArray(object);
                    break;
                case object_kind_t::kPrimitiveArray:
                    DumpPrimitiveArray(object);
                    break;
            }
        }
    }

    void TextDumper::DumpClass(const ResolvedClass &resolved) {
        out_ << "\nid " << resolved.class_id << ": class " << resolved.class_name.value_or(kMissingUtf8) << "\n";
        for (const auto &field: resolved.static_fields) {
            DumpField(field);
        }
    }

    void TextDumper::DumpInstance(const ResolvedObject &object) {
        out_ << "\nid " << object.id << ": " << object.class_name.value_or(kClassNotFound) << "\n";
        for (const auto &field: object.fields) {
            DumpField(field);
        }
    }

    void TextDumper::DumpObjectArray(const ResolvedObject &object) {
        out_ << "\nid " << object.id << ": " << object.class_name.value_or(kClassNotFound) << " = [\n";
        for (const auto &element: object.references) {
            if (element.IsNull()) {
                out_ << "  - null\n";
            } else {
                out_ << "  - id " << element.id << ": " << element.referent_type.value_or(kCouldNotResolveClass)
                     << "\n";
            }
        }
        out_ << "]\n";
    }

    void TextDumper::DumpPrimitiveArray(const ResolvedObject &object) {
        out_ << "\n" << object.id << ": " << java_type_name(object.element_type) << "[] = [";
        for (const auto &element: object.elements) {
            if (element.GetType() == value_type_t::kByte) {
                char hex[8];
                snprintf(hex, sizeof(hex), "0x%X", static_cast<uint8_t>(element.AsByte()));
                out_ << hex;
            } else {
                print_value(out_, element);
            }
            out_ << ", ";
        }
        out_ << "]\n";
    }

    void TextDumper::DumpField(const resolved_field_t &field) {
        const std::string name = field.name.value_or(kMissingUtf8);
        const Value &value = field.value;
        if (value.IsNull()) {
            out_ << "  - " << name << " = null\n";
        } else if (value.IsReference()) {
            out_ << "  - " << name << " = id " << value.AsObjectId() << " ("
                 << field.referent_type.value_or(field.referent_found ? kClassNotFound : kTypeNotFound) << ")\n";
        } else {
            out_ << "  - " << name << ": " << java_type_name(value.GetType()) << " = ";
            print_value(out_, value);
            out_ << "\n";
        }
    }
}
