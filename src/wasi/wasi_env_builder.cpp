#include "wasi/wasi_env_builder.hpp"

#include <algorithm>

#include "io/descriptor_file.hpp"
#include "io/host_stdio_file.hpp"

OUTCOME_CPP_DEFINE_CATEGORY_3(wasmbridge::wasi, WasiEnvBuilder::Error, e) {
  using E = wasmbridge::wasi::WasiEnvBuilder::Error;
  switch (e) {
    case E::ARGUMENT_CONTAINS_NUL:
      return "A guest argument contains a NUL byte";
    case E::ENVIRONMENT_VARIABLE_FORMAT:
      return "An environment variable has an empty name, or a name or value "
             "with a forbidden character";
    case E::MISSING_RUNTIME:
      return "No execution runtime was attached to the session";
    case E::MISSING_MODULE:
      return "No module was attached to the session";
  }
  return "Unknown error";
}

namespace wasmbridge::wasi {

  namespace {
    constexpr int kUnbound = -1;

    bool containsNul(const std::string &s) {
      return s.find('\0') != std::string::npos;
    }

    const char *streamName(size_t stream) {
      static constexpr const char *kNames[] = {"stdin", "stdout", "stderr"};
      return kNames[stream];
    }
  }  // namespace

  WasiEnvBuilder::WasiEnvBuilder() : program_name_{kDefaultProgramName} {
    host_fds_.fill(kUnbound);
  }

  WasiEnvBuilder &WasiEnvBuilder::programName(std::string name) {
    program_name_ = std::move(name);
    return *this;
  }

  WasiEnvBuilder &WasiEnvBuilder::arg(std::string value) {
    args_.push_back(std::move(value));
    return *this;
  }

  WasiEnvBuilder &WasiEnvBuilder::args(const std::vector<std::string> &values) {
    args_.insert(args_.end(), values.begin(), values.end());
    return *this;
  }

  WasiEnvBuilder &WasiEnvBuilder::env(std::string name, std::string value) {
    auto it = std::find_if(
        environment_.begin(), environment_.end(), [&name](const auto &entry) {
          return entry.first == name;
        });
    if (it != environment_.end()) {
      it->second = std::move(value);
    } else {
      environment_.emplace_back(std::move(name), std::move(value));
    }
    return *this;
  }

  WasiEnvBuilder &WasiEnvBuilder::envs(const Environment &variables) {
    for (const auto &[name, value] : variables) {
      env(name, value);
    }
    return *this;
  }

  WasiEnvBuilder &WasiEnvBuilder::bindStream(StdioStream stream, int host_fd) {
    host_fds_[static_cast<size_t>(stream)] = host_fd < 0 ? kUnbound : host_fd;
    return *this;
  }

  WasiEnvBuilder &WasiEnvBuilder::runtime(
      std::shared_ptr<runtime::ExecutionRuntime> rt) {
    runtime_ = std::move(rt);
    return *this;
  }

  WasiEnvBuilder &WasiEnvBuilder::module(
      std::shared_ptr<runtime::binaryen::WasmModule> module) {
    module_ = std::move(module);
    return *this;
  }

  outcome::result<void> WasiEnvBuilder::validate() const {
    if (containsNul(program_name_)
        || std::any_of(args_.begin(), args_.end(), containsNul)) {
      return Error::ARGUMENT_CONTAINS_NUL;
    }
    for (const auto &[name, value] : environment_) {
      if (name.empty() || name.find('=') != std::string::npos
          || containsNul(name) || containsNul(value)) {
        return Error::ENVIRONMENT_VARIABLE_FORMAT;
      }
    }
    if (!runtime_) {
      return Error::MISSING_RUNTIME;
    }
    if (!module_) {
      return Error::MISSING_MODULE;
    }
    return outcome::success();
  }

  outcome::result<std::shared_ptr<WasiEnv>> WasiEnvBuilder::finalize() {
    OUTCOME_TRY(validate());

    std::vector<std::string> argv;
    argv.reserve(args_.size() + 1);
    argv.push_back(program_name_);
    argv.insert(argv.end(), args_.begin(), args_.end());

    auto &io_context = runtime_->context();
    WasiEnv::Files files;
    WasiEnv::BoundFlags bound{};
    for (size_t stream = 0; stream < kStdioStreamCount; ++stream) {
      if (host_fds_[stream] != kUnbound) {
        auto file = io::DescriptorFile::create(io_context, host_fds_[stream]);
        if (file) {
          files[stream] = std::move(file.value());
          bound[stream] = true;
          continue;
        }
        logger_->warn("Cannot bind {} to host descriptor {}: {}",
                      streamName(stream),
                      host_fds_[stream],
                      file.error().message());
      }
      files[stream] = std::make_shared<io::HostStdioFile>(
          io_context, static_cast<int>(stream));
    }

    logger_->debug("Session built with {} arguments and {} environment "
                   "variables",
                   argv.size(),
                   environment_.size());
    return std::make_shared<WasiEnv>(std::move(argv),
                                     environment_,
                                     std::move(files),
                                     bound,
                                     runtime_,
                                     module_);
  }

}  // namespace wasmbridge::wasi
