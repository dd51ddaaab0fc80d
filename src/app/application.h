/**
 * @file application.h
 * @brief Main application class
 */

#ifndef MYBINLOG_APP_APPLICATION_H_
#define MYBINLOG_APP_APPLICATION_H_

#include <iosfwd>
#include <memory>

#include "app/command_line_parser.h"
#include "app/configuration_manager.h"
#include "utils/error.h"
#include "utils/expected.h"

namespace mybinlog::app {

/**
 * @brief Main application class
 *
 * Orchestrates one run of mybinlog-dump:
 * 1. Parse command-line arguments
 * 2. Load configuration and apply overrides
 * 3. Apply logging configuration
 * 4. Decode the binlog, printing one JSON line per event
 * 5. Print a summary line
 *
 * Usage:
 * @code
 * auto app = Application::Create(argc, argv);
 * if (!app) {
 *   std::cerr << "Failed to create application: " << app.error().to_string() << "\n";
 *   return 1;
 * }
 * return (*app)->Run();
 * @endcode
 */
class Application {
 public:
  /**
   * @brief Create application from command-line arguments
   * @param argc Argument count
   * @param argv Argument values
   * @return Expected with application instance or error
   *
   * Prints help or version immediately when requested. Does NOT apply
   * logging config or open the binlog (those happen in Run()).
   */
  // NOLINTNEXTLINE(cppcoreguidelines-avoid-c-arrays,modernize-avoid-c-arrays) - Standard C/C++ main signature
  static Expected<std::unique_ptr<Application>, Error> Create(int argc, char* argv[]);

  ~Application() = default;

  // Non-copyable, non-movable
  Application(const Application&) = delete;
  Application& operator=(const Application&) = delete;
  Application(Application&&) = delete;
  Application& operator=(Application&&) = delete;

  /**
   * @brief Run the application, writing event lines to stdout
   * @return Exit code (0 = success, 1 = error)
   */
  int Run();

  /**
   * @brief Run the application, writing event lines to out
   */
  int Run(std::ostream& out);

 private:
  Application(CommandLineArgs args, std::unique_ptr<ConfigurationManager> config_mgr);

  // Special modes (return exit code, -1 = not a special mode)
  int HandleSpecialModes();

  /**
   * @brief Decode the configured binlog and print it
   * @return Empty on success, the first fatal error otherwise
   */
  Expected<void, Error> Dump(std::ostream& out);

  CommandLineArgs args_;
  std::unique_ptr<ConfigurationManager> config_manager_;
};

}  // namespace mybinlog::app

#endif  // MYBINLOG_APP_APPLICATION_H_
