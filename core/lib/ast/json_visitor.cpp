// swlint/ast/json_visitor.cpp - JSON serialization implementation
//
#include "swlint/ast/json_visitor.hpp"

#include <cstdint>
#include <nlohmann/json.hpp>
#include <string>
#include <string_view>

#include "swlint/ast/ast.hpp"
#include "swlint/ast/ast_enums.hpp"
#include "swlint/basic/casting.hpp"
#include "swlint/basic/source_manager.hpp"

namespace swlint
{
namespace
{

using nlohmann::json;

// ============================================================================
// Helper functions
// ============================================================================

json j_range(SourceRange r)
{
  if (!r.is_valid()) {
    return json{{"start", nullptr}, {"end", nullptr}};
  }
  return json{{"start", r.get_begin().offset()}, {"end", r.get_end().offset()}};
}

json j_names(gsl::span<std::string_view> names)
{
  json out = json::array();
  for (const auto n : names) out.push_back(std::string(n));
  return out;
}

json j_node(const AstNode * node);

json j_modifier(const DeclModifier * m)
{
  json j{{"type", "DeclModifier"}, {"range", j_range(m->get_range())}, {"name", std::string(m->name)}};
  if (m->has_detail()) {
    j["detail"] = std::string(m->detail);
  }
  return j;
}

json j_modifiers(gsl::span<DeclModifier *> modifiers)
{
  json out = json::array();
  for (const auto * m : modifiers) out.push_back(j_modifier(m));
  return out;
}

json j_block(const CodeBlock * block)
{
  if (!block) return nullptr;
  json items = json::array();
  for (const auto * item : block->items) items.push_back(j_node(item));
  return json{{"type", "CodeBlock"}, {"range", j_range(block->get_range())}, {"items", items}};
}

json j_accessor(const AccessorDecl * a)
{
  json j{
    {"type", "AccessorDecl"},
    {"range", j_range(a->get_range())},
    {"kind", std::string(to_string(a->accessorKind))},
    {"modifiers", j_modifiers(a->modifiers)},
    {"body", j_block(a->body)}};
  if (a->isImplicit) {
    j["implicit"] = true;
  }
  return j;
}

json j_accessors(gsl::span<AccessorDecl *> accessors)
{
  json out = json::array();
  for (const auto * a : accessors) out.push_back(j_accessor(a));
  return out;
}

/// Fields shared by every declaration.
json j_decl_header(const Decl * d)
{
  json attrs = json::array();
  for (const auto * a : d->attributes) attrs.push_back(std::string(a->name));

  return json{
    {"type", std::string(to_string(d->get_kind()))},
    {"range", j_range(d->get_range())},
    {"attributes", attrs},
    {"modifiers", j_modifiers(d->modifiers)}};
}

// ============================================================================
// Declaration serialization
// ============================================================================

json j_decl(const Decl * d)
{
  json j = j_decl_header(d);

  if (const auto * td = dyn_cast<TypeDecl>(d)) {
    json members = json::array();
    for (const auto * m : td->members) members.push_back(j_decl(m));
    j["name"] = std::string(td->name);
    j["members"] = members;
    return j;
  }

  if (const auto * fn = dyn_cast<FunctionDecl>(d)) {
    j["name"] = std::string(fn->name);
    j["body"] = j_block(fn->body);
    return j;
  }

  if (const auto * init = dyn_cast<InitializerDecl>(d)) {
    j["body"] = j_block(init->body);
    return j;
  }

  if (const auto * deinit = dyn_cast<DeinitializerDecl>(d)) {
    j["body"] = j_block(deinit->body);
    return j;
  }

  if (const auto * sub = dyn_cast<SubscriptDecl>(d)) {
    j["accessors"] = j_accessors(sub->accessors);
    return j;
  }

  if (const auto * var = dyn_cast<VariableDecl>(d)) {
    json closures = json::array();
    for (const auto * c : var->closures) closures.push_back(j_block(c));
    j["isLet"] = var->isLet;
    j["names"] = j_names(var->names);
    j["accessors"] = j_accessors(var->accessors);
    j["closures"] = closures;
    return j;
  }

  if (const auto * ta = dyn_cast<TypeAliasDecl>(d)) {
    j["name"] = std::string(ta->name);
    return j;
  }

  if (const auto * ec = dyn_cast<EnumCaseDecl>(d)) {
    j["names"] = j_names(ec->names);
    return j;
  }

  if (const auto * imp = dyn_cast<ImportDecl>(d)) {
    j["path"] = std::string(imp->path);
    return j;
  }

  return j;
}

json j_node(const AstNode * node)
{
  if (!node) return nullptr;
  if (const auto * d = dyn_cast<Decl>(node)) return j_decl(d);
  if (const auto * b = dyn_cast<CodeBlock>(node)) return j_block(b);
  if (const auto * a = dyn_cast<AccessorDecl>(node)) return j_accessor(a);
  if (const auto * m = dyn_cast<DeclModifier>(node)) return j_modifier(m);
  if (const auto * attr = dyn_cast<Attribute>(node)) {
    return json{
      {"type", "Attribute"}, {"range", j_range(attr->get_range())}, {"name", std::string(attr->name)}};
  }
  return json{{"type", "UnknownNode"}, {"range", j_range(node->get_range())}};
}

}  // namespace

// ============================================================================
// Public API
// ============================================================================

nlohmann::json to_json(const AstNode * node)
{
  if (!node) return nlohmann::json{{"type", "null"}, {"range", j_range({})}};

  if (isa<SourceUnit>(node)) {
    return to_json(cast<SourceUnit>(node));
  }
  return j_node(node);
}

nlohmann::json to_json(const SourceUnit * unit)
{
  if (!unit)
    return nlohmann::json{
      {"type", "SourceUnit"}, {"range", j_range({})}, {"items", nlohmann::json::array()}};

  nlohmann::json items = nlohmann::json::array();
  for (const auto * item : unit->items) items.push_back(j_node(item));

  return nlohmann::json{
    {"type", "SourceUnit"}, {"range", j_range(unit->get_range())}, {"items", items}};
}

}  // namespace swlint
