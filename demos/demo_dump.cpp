#include "example_handlers.hpp"

#include <scribe/config.hpp>
#include <scribe/handlers/processor.hpp>
#include <scribe/lang/statement.hpp>
#include <scribe/log.hpp>
#include <scribe/registry_store.hpp>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <optional>
#include <sstream>

using namespace scribe;

static const char* object_kind_str(const CodeObject& obj) {
    if (obj.type() == CodeObjectType::Method) {
        return static_cast<const MethodObject&>(obj).scope() == Scope::Class
            ? "class method" : "method";
    }
    return code_object_type_name(obj.type());
}

static void dump_object(const CodeObject& obj, int depth) {
    std::string indent(depth * 2, ' ');
    std::cout << indent << object_kind_str(obj) << " " << obj.path();

    if (obj.type() == CodeObjectType::Class) {
        const auto& super = static_cast<const ClassObject&>(obj).superclass();
        if (super.is_set()) {
            std::cout << " < " << super.path();
            if (!super.is_resolved()) std::cout << " (unresolved)";
        }
    }
    if (obj.type() == CodeObjectType::Method) {
        auto vis = static_cast<const MethodObject&>(obj).visibility;
        if (vis != Visibility::Public) std::cout << "  [" << visibility_name(vis) << "]";
    }
    if (obj.type() == CodeObjectType::Constant) {
        std::cout << " = " << static_cast<const ConstantObject&>(obj).value;
    }
    if (obj.type() == CodeObjectType::ClassVariable) {
        std::cout << " = " << static_cast<const ClassVariableObject&>(obj).value;
    }
    if (obj.dynamic) std::cout << "  [dynamic]";
    if (!obj.ns_ref().is_resolved()) std::cout << "  [speculative]";
    std::cout << "  (" << obj.file << ":" << obj.line << ")\n";

    if (!obj.docstring.empty()) {
        std::istringstream doc(obj.docstring);
        std::string line;
        while (std::getline(doc, line)) std::cout << indent << "  | " << line << "\n";
    }

    if (obj.is_namespace()) {
        for (auto* child : static_cast<const NamespaceObject&>(obj).children()) {
            dump_object(*child, depth + 1);
        }
    }
}

static Config load_config() {
    std::optional<Config> global;
    std::optional<Config> project;

    std::string gpath = global_config_path();
    if (!gpath.empty() && std::filesystem::exists(gpath)) {
        auto r = Config::load(gpath);
        if (r.is_ok()) {
            global = std::move(r).value();
        } else {
            std::cerr << r.error().format() << "\n";
        }
    }
    if (std::filesystem::exists(PROJECT_CONFIG_FILE)) {
        auto r = Config::load(PROJECT_CONFIG_FILE);
        if (r.is_ok()) {
            project = std::move(r).value();
        } else {
            std::cerr << r.error().format() << "\n";
        }
    }
    return Config::effective(global, project);
}

int main(int argc, char* argv[]) {
    if (argc < 2) {
        std::cerr << "Usage: scribe-dump <file.rb> [--tokens] [--db path]\n";
        return 1;
    }

    std::string path = argv[1];
    bool show_tokens = false;
    std::string db_path;
    for (int i = 2; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--tokens") {
            show_tokens = true;
        } else if (arg == "--db" && i + 1 < argc) {
            db_path = argv[++i];
        } else {
            std::cerr << "error: unknown argument " << arg << "\n";
            return 1;
        }
    }

    Config cfg = load_config();
    cfg.apply_log_settings();

    std::ifstream f(path);
    if (!f) {
        std::cerr << "error: cannot open " << path << "\n";
        return 1;
    }
    std::ostringstream ss;
    ss << f.rdbuf();
    std::string source = ss.str();

    // Lex
    auto lr = lex(source, path);
    if (lr.is_err()) {
        std::cerr << lr.error().format() << "\n";
        return 1;
    }

    auto& lex_result = lr.value();
    std::cout << "--- " << path << " ---\n";
    std::cout << "Tokens: " << lex_result.tokens.size()
              << "  Comments: " << lex_result.comments.size() << "\n";

    if (show_tokens) {
        std::cout << "\n-- Tokens --\n";
        for (auto& t : lex_result.tokens) {
            if (t.type == RubyTokenType::Whitespace) continue;
            std::cout << "  " << t.pos.line << ":" << t.pos.col
                      << "  " << ruby_token_name(t.type)
                      << "  \"" << (t.type == RubyTokenType::Newline ? "\\n" : t.text)
                      << "\"\n";
        }
    }

    // Statements
    auto sr = build_statements(lex_result);
    if (sr.is_err()) {
        std::cerr << sr.error().format() << "\n";
        return 1;
    }
    std::cout << "Statements: " << sr.value().size() << "\n\n";

    // Handlers
    HandlerRegistry handlers;
    auto installed = examples::install_example_handlers(handlers, cfg.parser.family);
    if (installed.is_err()) {
        std::cerr << installed.error().format() << "\n";
        return 1;
    }

    Registry registry;
    RegistryStore store;
    if (!db_path.empty()) {
        auto opened = store.open(db_path);
        if (opened.is_err()) {
            std::cerr << opened.error().format() << "\n";
            return 1;
        }
        auto loaded = store.load(registry);
        if (loaded.is_err()) {
            std::cerr << loaded.error().format() << "\n";
            return 1;
        }
        if (registry.size() > 0) {
            std::cout << "Loaded " << registry.size() << " objects from " << db_path << "\n\n";
        }
    }

    Processor processor(registry, handlers, path, cfg.parser.family);
    processor.builtins().add(cfg.extra_builtins);
    processor.resolver().set_enabled(cfg.parser.load_order_errors);

    auto ctx = processor.top_level_context();
    auto parsed = processor.parse(sr.value(), ctx);
    if (parsed.is_err()) {
        std::cerr << parsed.error().format() << "\n";
        return 1;
    }

    std::cout << "Objects: " << registry.size() << "\n";
    for (auto* child : registry.root()->children()) dump_object(*child, 1);

    // Objects whose namespace never appeared are not reachable from root
    for (auto* obj : registry.all()) {
        if (obj->ns_ref().is_set() && !obj->ns_ref().is_resolved()) dump_object(*obj, 1);
    }

    if (!processor.diagnostics().empty()) {
        std::cout << "\nDiagnostics:\n";
        for (const auto& d : processor.diagnostics()) {
            std::cout << "  " << d.file << ":" << d.line << "  [" << ScribeError::code_name(d.code)
                      << "] " << (d.handler.empty() ? "" : d.handler + ": ") << d.message << "\n";
        }
    }
    if (registry.pending_count() > 0) {
        std::cout << "\nPending: " << registry.pending_count() << "\n";
    }

    if (store.is_open()) {
        auto saved = store.save(registry);
        if (saved.is_err()) {
            std::cerr << saved.error().format() << "\n";
            return 1;
        }
        std::cout << "\nSaved " << registry.size() << " objects to " << db_path << "\n";
    }

    return 0;
}
