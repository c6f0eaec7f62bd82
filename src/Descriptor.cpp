#include <NGIN/ObjectModel/Descriptor.hpp>
#include <NGIN/ObjectModel/Registry.hpp>

namespace NGIN::ObjectModel
{

  namespace
  {
    MemberDescriptor Named(std::string_view name)
    {
      MemberDescriptor desc{};
      desc.nameId = detail::InternNameId(name);
      desc.name = detail::NameFromId(desc.nameId);
      return desc;
    }

    MemberDecl VariableWith(std::string_view name, Visibility visibility, Scope scope)
    {
      auto desc = Named(name);
      desc.visibility = visibility;
      desc.scope = scope;
      return MemberDecl{std::move(desc)};
    }
  } // namespace

  MemberDecl Variable(std::string_view name) { return VariableWith(name, Visibility::Public, Scope::Instance); }
  MemberDecl Public(std::string_view name) { return VariableWith(name, Visibility::Public, Scope::Instance); }
  MemberDecl Protected(std::string_view name) { return VariableWith(name, Visibility::Protected, Scope::Instance); }
  MemberDecl Private(std::string_view name) { return VariableWith(name, Visibility::Private, Scope::Instance); }
  MemberDecl Static(std::string_view name) { return VariableWith(name, Visibility::Public, Scope::Static); }

  MemberDecl Constant(std::string_view name, Any value)
  {
    auto desc = Named(name);
    desc.mutability = Mutability::Constant;
    desc.defaultValue = std::move(value);
    desc.hasDefault = true;
    return MemberDecl{std::move(desc)};
  }

  MemberDecl Constant(std::string_view name)
  {
    auto desc = Named(name);
    desc.mutability = Mutability::Constant;
    return MemberDecl{std::move(desc)};
  }

  MemberDecl Method(std::string_view name, NGIN::UIntSize arity, MethodFn fn)
  {
    auto desc = Named(name);
    desc.mutability = Mutability::Method;
    desc.arity = arity;
    desc.body = fn;
    return MemberDecl{std::move(desc)};
  }

  MemberDecl AbstractMethod(std::string_view name, NGIN::UIntSize arity)
  {
    auto desc = Named(name);
    desc.mutability = Mutability::Method;
    desc.arity = arity;
    desc.isAbstract = true;
    return MemberDecl{std::move(desc)};
  }

} // namespace NGIN::ObjectModel
