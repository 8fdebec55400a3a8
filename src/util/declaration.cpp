#include <adocref/declaration.hpp>

namespace adocref {

AttributeDeclaration AttributeDeclaration::indexed(std::string name,
                                                   std::optional<std::string> value,
                                                   SourcePos pos) {
    return AttributeDeclaration(Origin::Indexed, std::move(name),
                                std::move(value), std::move(pos));
}

AttributeDeclaration AttributeDeclaration::directory_derived(std::string name,
                                                             std::string value) {
    return AttributeDeclaration(Origin::DirectoryDerived, std::move(name),
                                std::move(value), std::nullopt);
}

AttributeDeclaration AttributeDeclaration::metadata_derived(std::string name,
                                                            std::string value) {
    return AttributeDeclaration(Origin::MetadataDerived, std::move(name),
                                std::move(value), std::nullopt);
}

} // namespace adocref
