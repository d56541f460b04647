#include <signal.h>

#include <atomic>
#include <exception>
#include <filesystem>
#include <iostream>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "fdup/error.h"
#include "fdup/orchestrator/config.h"
#include "fdup/orchestrator/duplication_pipeline.h"
#include "fdup/orchestrator/event_bus.h"
#include "fdup/security/secret_key.h"

namespace {

  constexpr int kExitOk = 0;
  constexpr int kExitFailure = 1;

  std::atomic<bool> g_interrupted{false};

  void TerminationSignalHandler(int) {
    g_interrupted.store(true);
  }

  // Routes SIGINT/SIGTERM into a flag the transfer polls between reads.
  class TerminationSignalGuard {
   public:
    TerminationSignalGuard() {
      struct sigaction sa {};
      sa.sa_handler = TerminationSignalHandler;
      sigemptyset(&sa.sa_mask);
      sa.sa_flags = 0;
      int_installed_ = sigaction(SIGINT, &sa, &old_int_) == 0;
      term_installed_ = sigaction(SIGTERM, &sa, &old_term_) == 0;
      if (!int_installed_ || !term_installed_) {
        std::cerr << "Warning: could not install signal handlers; an interrupted transfer "
                     "will not clean up the partial upload\n";
      }
    }
    ~TerminationSignalGuard() {
      if (int_installed_) {
        sigaction(SIGINT, &old_int_, nullptr);
      }
      if (term_installed_) {
        sigaction(SIGTERM, &old_term_, nullptr);
      }
    }

    TerminationSignalGuard(const TerminationSignalGuard&) = delete;
    TerminationSignalGuard& operator=(const TerminationSignalGuard&) = delete;

   private:
    struct sigaction old_int_ {};
    struct sigaction old_term_ {};
    bool int_installed_{false};
    bool term_installed_{false};
  };

  std::string ProgramName(const char* argv0) {
    if (!argv0 || !*argv0) {
      return "fdup";
    }
    return std::filesystem::path(argv0).filename().string();
  }

  void PrintUsage(std::ostream& out, const std::string& program) {
    out << fdup::orchestrator::UsageText(program);
  }

  std::string_view DomainPrefix(fdup::ErrorDomain domain) {
    switch (domain) {
    case fdup::ErrorDomain::IO:
      return "I/O error";
    case fdup::ErrorDomain::Security:
      return "Security error";
    case fdup::ErrorDomain::Crypto:
      return "Cryptography error";
    case fdup::ErrorDomain::Validation:
      return "Validation error";
    case fdup::ErrorDomain::Config:
      return "Configuration error";
    case fdup::ErrorDomain::State:
      return "State error";
    case fdup::ErrorDomain::Internal:
      return "Internal error";
    }
    return "Error";
  }

} // namespace

int main(int argc, char** argv) {
  const std::string program = ProgramName(argc > 0 ? argv[0] : nullptr);
  std::vector<std::string_view> args;
  for (int i = 1; i < argc; ++i) {
    args.emplace_back(argv[i]);
  }

  // Taken before anything else so no child process inherits it.
  auto secret = fdup::security::SecretKey::TakeFromEnvironment(
      fdup::orchestrator::kEncryptionKeyVariable);

  fdup::orchestrator::ImagerConfig config;
  try {
    config = fdup::orchestrator::ParseImagerConfig(args);
  } catch (const fdup::Error& err) {
    std::cerr << DomainPrefix(err.domain) << ": " << err.what() << '\n';
    PrintUsage(std::cerr, program);
    return kExitFailure;
  }
  if (config.mode == fdup::orchestrator::RunMode::kHelp) {
    PrintUsage(std::cout, program);
    return kExitOk;
  }

  try {
    fdup::orchestrator::RunLogger logger(config.log_file);
    logger.Attach(fdup::orchestrator::EventBus::Instance());
    fdup::orchestrator::LogInfo("run_start", "Starting " + program);

    std::optional<std::filesystem::path> client_log;
    if (logger.file_ok()) {
      client_log = config.log_file;
    }
    fdup::orchestrator::SystemCollaborators collaborators(config, client_log);
    TerminationSignalGuard signals;
    fdup::orchestrator::DuplicationController controller(
        config, fdup::orchestrator::MakeSystemEnvironment(
                    collaborators, [] { return g_interrupted.load(); }));

    const auto outcome = config.mode == fdup::orchestrator::RunMode::kList
                             ? controller.ListDisks()
                             : controller.Run(std::move(secret));
    if (outcome.show_usage) {
      PrintUsage(std::cerr, program);
    }
    return outcome.exit_code;
  } catch (const fdup::Error& err) {
    std::cerr << DomainPrefix(err.domain) << ": " << err.what() << std::endl;
    return kExitFailure;
  } catch (const std::exception& err) {
    std::cerr << "Error: " << err.what() << std::endl;
    return kExitFailure;
  }
}
