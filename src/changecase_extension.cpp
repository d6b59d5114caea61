#define DUCKDB_EXTENSION_MAIN
#include "changecase_extension.hpp"
#include "case_functions.hpp"
#include "duckdb/main/extension/extension_loader.hpp"

namespace duckdb {

void ChangecaseExtension::Load(ExtensionLoader &loader) {
    changecase::RegisterCaseTransformFunctions(loader);
}

std::string ChangecaseExtension::Name() {
    return "changecase";
}

std::string ChangecaseExtension::Version() const {
#ifdef EXT_VERSION
    return EXT_VERSION;
#else
    return "v0.1.0";
#endif
}

} // namespace duckdb

// Entry point for the loadable extension
extern "C" {
DUCKDB_CPP_EXTENSION_ENTRY(changecase, loader) {
    duckdb::ChangecaseExtension ext;
    ext.Load(loader);
}
}
