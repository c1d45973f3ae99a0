#pragma once

namespace vscore {

// Builds a std::visit visitor out of lambdas, one per alternative:
//
//   std::visit(Overloaded{
//       [](hir::EntityId id) { ... },
//       [](hir::PackageId id) { ... },
//   }, scope_ref);
template <class... Ts>
struct Overloaded : Ts... {
  using Ts::operator()...;
};

template <class... Ts>
Overloaded(Ts...) -> Overloaded<Ts...>;

}  // namespace vscore
