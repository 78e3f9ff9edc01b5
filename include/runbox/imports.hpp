#pragma once

#include <string>
#include <string_view>

namespace runbox {

    struct import_extraction {
        // top-level import declarations in source order, one per line group
        std::string imports{};
        // the input with every removed declaration replaced by its newlines
        std::string remaining_code{};
        // lines occupied by `imports` when emitted above other code
        size_t import_line_count{};
        bool parse_failed{false};

        bool has_static_imports() const { return !imports.empty(); }
    };

    // Separates top-level `import ... from`, bare `import '...'` and
    // `import x = require(...)` declarations from body code. Dynamic
    // `import(...)` and `import.meta` stay in the body. On a lexing failure
    // the input is returned untouched with no imports and the failure logged.
    import_extraction extract_imports(std::string_view code);

    // `require(` followed by a string or template literal, outside comments
    // and strings.
    bool has_require_calls(std::string_view code);

    struct dependency_report {
        import_extraction extraction{};
        bool uses_require{false};

        bool has_imports() const { return extraction.has_static_imports() || uses_require; }
    };

    dependency_report analyze_dependencies(std::string_view code);

}  // namespace runbox
