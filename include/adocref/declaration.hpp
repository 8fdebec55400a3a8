#pragma once

#include <adocref/lang/token.hpp>
#include <optional>
#include <string>

namespace adocref {

// An attribute value known to the resolver. Indexed declarations come from a
// `:name: value` line in a document; directory- and metadata-derived ones are
// synthesized and never carry a source position.
class AttributeDeclaration {
public:
    enum class Origin { Indexed, DirectoryDerived, MetadataDerived };

    static AttributeDeclaration indexed(std::string name,
                                        std::optional<std::string> value,
                                        SourcePos pos);
    static AttributeDeclaration directory_derived(std::string name, std::string value);
    static AttributeDeclaration metadata_derived(std::string name, std::string value);

    Origin origin() const { return origin_; }
    const std::string& name() const { return name_; }
    // nullopt for an unset declaration (`:name!:`)
    const std::optional<std::string>& value() const { return value_; }
    const std::optional<SourcePos>& pos() const { return pos_; }

private:
    AttributeDeclaration(Origin origin, std::string name,
                         std::optional<std::string> value,
                         std::optional<SourcePos> pos)
        : origin_(origin), name_(std::move(name)),
          value_(std::move(value)), pos_(std::move(pos)) {}

    Origin origin_;
    std::string name_;
    std::optional<std::string> value_;
    std::optional<SourcePos> pos_;
};

// A block anchor: [[id]] or [#id]
struct BlockId {
    std::string id;
    SourcePos pos;
};

} // namespace adocref
