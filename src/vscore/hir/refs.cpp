#include "vscore/hir/refs.hpp"

#include <format>
#include <variant>

#include "vscore/common/overloaded.hpp"

namespace vscore::hir {

auto IsOverloadable(const Def& def) -> bool {
  return std::holds_alternative<EnumLitRef>(def);
}

auto ToDef(const DeclRef& decl) -> Def {
  return std::visit([](auto id) -> Def { return id; }, decl);
}

auto ToString(const Def& def) -> std::string {
  return std::visit(
      Overloaded{
          [](const EnumLitRef& lit) {
            return std::format(
                "enum literal {} of {}#{}", lit.index, ToString(lit.type.kKind),
                lit.type.value);
          },
          [](auto id) {
            return std::format("{}#{}", ToString(id.kKind), id.value);
          },
      },
      def);
}

auto ToString(const ScopeRef& scope) -> std::string {
  return std::visit(
      [](auto id) { return std::format("{}#{}", ToString(id.kKind), id.value); },
      scope);
}

auto DescribeKind(const Def& def) -> const char* {
  return std::visit(
      Overloaded{
          [](LibraryId) { return "library"; },
          [](EntityId) { return "entity"; },
          [](ConfigurationId) { return "configuration"; },
          [](PackageId) { return "package"; },
          [](PackageInstanceId) { return "package instance"; },
          [](ContextId) { return "context"; },
          [](TypeDeclId) { return "type"; },
          [](SubtypeDeclId) { return "subtype"; },
          [](const EnumLitRef&) { return "enumeration literal"; },
          [](ConstDeclId) { return "constant"; },
          [](SignalDeclId) { return "signal"; },
          [](VariableDeclId) { return "variable"; },
          [](FileDeclId) { return "file"; },
      },
      def);
}

}  // namespace vscore::hir
