// adocref-resolve: query the reference resolver for a documentation project.
//
//     adocref-resolve <project-dir> <context> key <key> [family]
//     adocref-resolve <project-dir> <context> expand <text>
//     adocref-resolve <project-dir> <context> attrs [name]
//     adocref-resolve <project-dir> <context> prefixes
//     adocref-resolve <project-dir> <context> id <block-id>
//
// <context> is the file (or directory) the reference appears in.

#include <adocref/resolver.hpp>
#include <adocref/log.hpp>

#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <string>
#include <vector>

namespace fs = std::filesystem;
using namespace adocref;

static const char* USAGE =
    "usage: adocref-resolve <project-dir> <context> "
    "(key <key> [family] | expand <text> | attrs [name] | prefixes | id <block-id>)";

struct Command {
    fs::path project_dir;
    fs::path context;
    std::string verb;
    std::vector<std::string> args;
};

static Result<Command> parse_args(int argc, char** argv) {
    if (argc < 4) {
        return RefError{RefError::InvalidArg, "missing arguments", USAGE};
    }
    Command cmd;
    cmd.project_dir = argv[1];
    cmd.context = fs::absolute(argv[2]).lexically_normal();
    cmd.verb = argv[3];
    for (int i = 4; i < argc; ++i) cmd.args.push_back(argv[i]);

    if ((cmd.verb == "key" || cmd.verb == "expand" || cmd.verb == "id") &&
        cmd.args.empty()) {
        return RefError{RefError::InvalidArg,
            "'" + cmd.verb + "' needs an argument", USAGE};
    }
    if (cmd.verb != "key" && cmd.verb != "expand" && cmd.verb != "attrs" &&
        cmd.verb != "prefixes" && cmd.verb != "id") {
        return RefError{RefError::InvalidArg, "unknown command: " + cmd.verb, USAGE};
    }
    return Result<Command>::ok(std::move(cmd));
}

static const char* origin_str(AttributeDeclaration::Origin o) {
    switch (o) {
    case AttributeDeclaration::Origin::Indexed:          return "indexed";
    case AttributeDeclaration::Origin::DirectoryDerived: return "directory";
    case AttributeDeclaration::Origin::MetadataDerived:  return "metadata";
    }
    return "?";
}

static void print_declarations(const std::vector<AttributeDeclaration>& decls) {
    for (auto& d : decls) {
        std::cout << "  " << d.name() << " = "
                  << (d.value() ? *d.value() : std::string("<unset>"))
                  << "  [" << origin_str(d.origin()) << "]";
        if (d.pos()) {
            std::cout << "  " << d.pos()->file << ":" << d.pos()->line;
        }
        std::cout << "\n";
    }
}

static Status run(int argc, char** argv) {
    auto cmd = parse_args(argc, argv);
    ADOCREF_TRY(cmd);
    const Command& c = cmd.value();

    if (std::getenv("ADOCREF_LOG")) {
        auto level = log::parse_level(std::getenv("ADOCREF_LOG"));
        ADOCREF_TRY(level);
        log::set_level(level.value());
    }

    auto index = WorkspaceIndex::open(c.project_dir);
    if (index.is_err()) return std::move(index).error();

    ReferenceResolver resolver(*index.value(),
                               ResolveOptions::from_config(index.value()->config()));

    if (c.verb == "key") {
        std::optional<Family> family;
        if (c.args.size() > 1) {
            family = parse_family(c.args[1]);
            if (!family) {
                return RefError{RefError::InvalidArg, "unknown family: " + c.args[1],
                    "expected one of: example, attachment, partial, image, page"};
            }
        }
        for (auto& candidate : resolver.resolve_key(c.context, c.args[0], family)) {
            std::cout << candidate << "\n";
        }
    } else if (c.verb == "expand") {
        auto expanded = resolver.expand_attributes(c.context, c.args[0]);
        if (!expanded) {
            return RefError{RefError::NotFound,
                "attribute reference is ambiguous: " + c.args[0],
                "run 'attrs <name>' to list the conflicting declarations"};
        }
        std::cout << *expanded << "\n";
    } else if (c.verb == "attrs") {
        if (c.args.empty()) {
            print_declarations(resolver.collect_attributes(c.context));
        } else {
            print_declarations(resolver.find_attributes(c.context, c.args[0]));
        }
    } else if (c.verb == "prefixes") {
        auto module = resolver.module_root(c.context);
        if (!module) {
            return RefError{RefError::NotFound,
                "not inside an Antora module: " + c.context.string()};
        }
        for (auto& m : resolver.collect_prefixes(*module)) {
            std::cout << m.prefix << "  " << m.title << "\n";
        }
    } else if (c.verb == "id") {
        for (auto& b : resolver.find_block_ids(c.args[0])) {
            std::cout << b.pos.file << ":" << b.pos.line << "  " << b.id << "\n";
        }
    }
    return ok_status();
}

int main(int argc, char** argv) {
    auto status = run(argc, argv);
    if (status.is_err()) {
        std::cerr << status.error().format() << "\n";
        return 1;
    }
    return 0;
}
