/**
 * Examples for enumkit::meta enum utilities
 *
 * This file demonstrates:
 * 1. Declaring enums with metadata
 * 2. Lookup by value and by name
 * 3. Formatting and parsing under format orders
 * 4. Flag operations
 * 5. Custom formats
 * 6. Validation and range-checked conversion
 */

#include "enumkit/meta/enums.hpp"

#include <cstdint>
#include <iomanip>
#include <iostream>
#include <string>

#include <spdlog/spdlog.h>

using namespace enumkit::meta;

enum class Permission : std::uint8_t {
    None = 0x00,
    Read = 0x01,
    Write = 0x02,
    Execute = 0x04,
    Admin = 0x08,
    ReadWrite = Read | Write,
};

ENUMKIT_FLAG_OPERATORS(Permission)

enum class HttpStatus : std::int16_t {
    OK = 200,
    Success = 200,
    Created = 201,
    NoContent = 204,
    BadRequest = 400,
    NotFound = 404,
    ServerError = 500,
};

struct Glyph {
    std::string text;
};

ENUMKIT_ENUM_TRAITS(Permission,
                    EnumDeclaration<Permission>("Permission")
                        .flags()
                        .member("None", Permission::None)
                        .member("Read", Permission::Read, Glyph{"r"})
                        .member("Write", Permission::Write, Glyph{"w"})
                        .member("Execute", Permission::Execute, Glyph{"x"})
                        .member("Admin", Permission::Admin,
                                Description{"Full control"})
                        .member("ReadWrite", Permission::ReadWrite));

ENUMKIT_ENUM_TRAITS(
    HttpStatus,
    EnumDeclaration<HttpStatus>("HttpStatus")
        .member("Success", HttpStatus::Success)
        .primary("OK", HttpStatus::OK, Description{"Request succeeded"})
        .member("Created", HttpStatus::Created,
                Description{"Resource created"})
        .member("NoContent", HttpStatus::NoContent)
        .member("BadRequest", HttpStatus::BadRequest,
                Description{"Malformed request"})
        .member("NotFound", HttpStatus::NotFound,
                Description{"Resource not found"})
        .member("ServerError", HttpStatus::ServerError)
        .validator([](HttpStatus status) {
            auto code = static_cast<std::int16_t>(status);
            return code >= 100 && code < 600;
        }));

void printHeader(const std::string& title) {
    std::cout << "\n==========================================================="
              << std::endl;
    std::cout << "  " << title << std::endl;
    std::cout << "==========================================================="
              << std::endl;
}

void printValue(const std::string& label, const std::string& value) {
    std::cout << std::left << std::setw(30) << label << ": " << value
              << std::endl;
}

void printValue(const std::string& label, bool value) {
    std::cout << std::left << std::setw(30) << label << ": "
              << (value ? "true" : "false") << std::endl;
}

int main() {
    spdlog::set_level(spdlog::level::debug);

    printHeader("1. Lookup");
    printValue("enum_name(200)", std::string(enum_name(HttpStatus::Success)));
    printValue("description of 404",
               std::string(enum_description(HttpStatus::NotFound)
                               .value_or("<none>")));
    if (const auto* member = get_member<HttpStatus>("notfound", true)) {
        printValue("case-insensitive 'notfound'",
                   std::to_string(member->toInt64()));
    }
    std::cout << "Distinct HttpStatus members:" << std::endl;
    for (const auto& member :
         get_members<HttpStatus>(EnumMemberSelection::Distinct)) {
        std::cout << "  " << std::left << std::setw(12) << member.name()
                  << " = " << member.toInt64() << std::endl;
    }

    printHeader("2. Formatting and Parsing");
    const auto perms = Permission::Read | Permission::Execute;
    printValue("as_string(Read|Execute)", as_string(perms));
    printValue("format(Read|Execute, \"X\")", format(perms, "X"));
    printValue("format(Read|Execute, \"D\")", format(perms, "D"));
    printValue("format_flags with ' | '", format_flags(perms, " | "));
    printValue("parse(\"Write, Execute\")",
               as_string(parse<Permission>("Write, Execute")));
    printValue("parse(\"0x1F4\", hex)",
               as_string(parse<HttpStatus>("0x1F4", false,
                                           {EnumFormat::HexadecimalValue})));
    try {
        static_cast<void>(parse<HttpStatus>("Teapot"));
    } catch (const enumkit::error::ParseError& e) {
        printValue("parse(\"Teapot\")", e.getMessage());
    }
    try {
        static_cast<void>(parse<Permission>("300"));
    } catch (const enumkit::error::OverflowError& e) {
        printValue("parse(\"300\")", e.getMessage());
    }

    printHeader("3. Flag Operations");
    printValue("has_all_flags(perms, Read)",
               has_all_flags(perms, Permission::Read));
    printValue("has_any_flags(perms, Write)",
               has_any_flags(perms, Permission::Write));
    printValue("toggle_flags(perms)", as_string(toggle_flags(perms)));
    printValue("remove_flags(perms, Read)",
               as_string(remove_flags(perms, Permission::Read)));
    printValue("all flags", as_string(get_all_flags<Permission>()));
    std::cout << "Flags of Read|Execute:";
    for (auto flag : get_flags(perms)) {
        std::cout << " " << enum_name(flag);
    }
    std::cout << std::endl;

    printHeader("4. Custom Formats");
    auto glyph = register_custom_format([](const MemberInfo& member) {
        const auto* item = member.getAttribute<Glyph>();
        return item != nullptr ? item->text : std::string{};
    });
    printValue("glyphs of Read|Execute",
               format_flags(perms, "", {glyph}).value_or("<none>"));
    printValue("glyph of Admin, else name",
               as_string(Permission::Admin, {glyph, EnumFormat::Name})
                   .value_or("<none>"));
    printValue("parse(\"w\", glyph)",
               as_string(parse<Permission>("w", false, {glyph})));

    printHeader("5. Validation");
    printValue("is_valid(Read|Admin)",
               is_valid(Permission::Read | Permission::Admin));
    printValue("is_valid(Permission 0x10)",
               is_valid(static_cast<Permission>(0x10)));
    printValue("is_valid(HttpStatus 418)",
               is_valid(static_cast<HttpStatus>(418)));
    printValue("is_defined(HttpStatus 418)",
               is_defined(static_cast<HttpStatus>(418)));
    try {
        static_cast<void>(to_object<HttpStatus>(70000));
    } catch (const enumkit::error::OverflowError& e) {
        printValue("to_object(70000)", e.getMessage());
    }

    return 0;
}
