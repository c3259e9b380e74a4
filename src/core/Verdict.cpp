#include "core/Verdict.hpp"

#include <sstream>

namespace commitcheck {

std::string formatVerdict(const Verdict& verdict) {
    std::ostringstream out;
    out << (verdict.isValid() ? "VALID" : "INVALID") << "\n";
    if (!verdict.errors.empty()) {
        out << "errors:\n";
        for (const auto& e : verdict.errors) out << "  - " << e << "\n";
    }
    if (!verdict.suggestions.empty()) {
        out << "suggestions:\n";
        for (const auto& s : verdict.suggestions) out << "  - " << s << "\n";
    }
    return out.str();
}

}
