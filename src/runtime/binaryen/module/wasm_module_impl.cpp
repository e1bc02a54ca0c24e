#include "runtime/binaryen/module/wasm_module_impl.hpp"

#include <sstream>

#include <boost/assert.hpp>

#include <binaryen/wasm-binary.h>
#include <binaryen/wasm-validator.h>

#include "runtime/binaryen/module/wasm_module_instance_impl.hpp"

OUTCOME_CPP_DEFINE_CATEGORY_3(wasmbridge::runtime::binaryen,
                              WasmModuleImpl::Error,
                              e) {
  using wasmbridge::runtime::binaryen::WasmModuleImpl;
  switch (e) {
    case WasmModuleImpl::Error::EMPTY_CODE:
      return "Provided WebAssembly code is empty";
    case WasmModuleImpl::Error::INVALID_CODE:
      return "Provided WebAssembly code could not be parsed";
    case WasmModuleImpl::Error::VALIDATION_FAILED:
      return "Provided WebAssembly code failed validation";
  }
  return "Unknown error";
}

namespace wasmbridge::runtime::binaryen {

  namespace {
    ExternalKind toExternalKind(wasm::ExternalKind kind) {
      switch (kind) {
        case wasm::ExternalKind::Function:
          return ExternalKind::FUNCTION;
        case wasm::ExternalKind::Table:
          return ExternalKind::TABLE;
        case wasm::ExternalKind::Memory:
          return ExternalKind::MEMORY;
        case wasm::ExternalKind::Global:
          return ExternalKind::GLOBAL;
        default:
          return ExternalKind::OTHER;
      }
    }
  }  // namespace

  WasmModuleImpl::WasmModuleImpl(std::unique_ptr<wasm::Module> &&module)
      : module_{std::move(module)} {
    BOOST_ASSERT(module_);
  }

  WasmModuleImpl::~WasmModuleImpl() = default;

  outcome::result<std::unique_ptr<WasmModuleImpl>>
  WasmModuleImpl::createFromCode(gsl::span<const uint8_t> code) {
    auto logger = base::createLogger("WasmModule");
    if (code.empty()) {
      return Error::EMPTY_CODE;
    }

    auto module = std::make_unique<wasm::Module>();
    module->features = wasm::FeatureSet::All;
    {
      std::vector<char> bytes(code.begin(), code.end());
      wasm::WasmBinaryBuilder parser(*module, bytes, false);

      try {
        parser.read();
      } catch (wasm::ParseException &e) {
        std::ostringstream msg;
        e.dump(msg);
        logger->error("Cannot parse module: {}", msg.str());
        return Error::INVALID_CODE;
      }
    }

    if (!wasm::WasmValidator().validate(*module)) {
      logger->error("Module failed validation");
      return Error::VALIDATION_FAILED;
    }

    return std::unique_ptr<WasmModuleImpl>(
        new WasmModuleImpl(std::move(module)));
  }

  std::vector<ImportDescriptor> WasmModuleImpl::imports() const {
    std::vector<ImportDescriptor> result;
    for (const auto &func : module_->functions) {
      if (func->imported()) {
        result.push_back({func->module.c_str(),
                          func->base.c_str(),
                          ExternalKind::FUNCTION});
      }
    }
    for (const auto &global : module_->globals) {
      if (global->imported()) {
        result.push_back({global->module.c_str(),
                          global->base.c_str(),
                          ExternalKind::GLOBAL});
      }
    }
    if (module_->memory.imported()) {
      result.push_back({module_->memory.module.c_str(),
                        module_->memory.base.c_str(),
                        ExternalKind::MEMORY});
    }
    if (module_->table.imported()) {
      result.push_back({module_->table.module.c_str(),
                        module_->table.base.c_str(),
                        ExternalKind::TABLE});
    }
    return result;
  }

  std::vector<ExportDescriptor> WasmModuleImpl::exports() const {
    std::vector<ExportDescriptor> result;
    result.reserve(module_->exports.size());
    for (const auto &exp : module_->exports) {
      size_t param_count = 0;
      if (exp->kind == wasm::ExternalKind::Function) {
        if (auto *func = module_->getFunctionOrNull(exp->value)) {
          param_count = func->getNumParams();
        }
      }
      result.push_back(
          {exp->name.c_str(), toExternalKind(exp->kind), param_count});
    }
    return result;
  }

  outcome::result<std::unique_ptr<WasmModuleInstance>>
  WasmModuleImpl::instantiate(
      const std::shared_ptr<wasi::WasiHost> &host) const {
    auto rei = std::make_shared<RuntimeExternalInterface>(host);
    OUTCOME_TRY(instance, WasmModuleInstanceImpl::create(*module_, rei));
    return std::unique_ptr<WasmModuleInstance>(std::move(instance));
  }

}  // namespace wasmbridge::runtime::binaryen
