#ifndef LAMBDALOCAL_EMULATOR_CONFIG_HPP
#define LAMBDALOCAL_EMULATOR_CONFIG_HPP

#include <istream>
#include <optional>
#include <string>
#include <vector>

namespace cereal {
  struct JSONInputArchive;
} // namespace cereal

namespace lambdalocal::emulator::config {

  struct Function {

    static constexpr char DEFAULT_NAME[] = "test";
    static constexpr char DEFAULT_VERSION[] = "$LATEST";
    static constexpr int DEFAULT_MEMORY_SIZE = 1536;
    static constexpr int DEFAULT_TIMEOUT = 300;
    static constexpr char DEFAULT_REGION[] = "us-east-1";
    static constexpr char DEFAULT_ACCOUNT_ID[] = "000000000000";
    static constexpr char DEFAULT_HANDLER[] = "handler";

    std::string name;
    std::string version;
    int memory_size;
    // Seconds
    int timeout;
    std::string region;
    std::string account_id;
    std::string handler;

    std::optional<std::string> trace_id;
    std::optional<std::string> client_context;
    std::optional<std::string> cognito_identity;
    // Replaces the ARN derived from region, account and name.
    std::optional<std::string> invoked_arn;

    // Non-digit characters of the account ID are dropped.
    std::string arn() const;

    void load(cereal::JSONInputArchive& archive);
    void load_env();
    void set_defaults();
    void validate() const;
  };

  struct RuntimeAPI {

    static constexpr char API_VERSION[] = "2018-06-01";
    static constexpr char DEFAULT_ADDRESS[] = "127.0.0.1";
    static constexpr int DEFAULT_PORT = 9001;
    static constexpr int DEFAULT_THREADS_NUMBER = 2;
    // 6 MiB, the synchronous payload limit of the cloud runtime.
    static constexpr int DEFAULT_MAX_PAYLOAD_SIZE = 6 * 1024 * 1024;

    std::string address;
    int port;
    int threads;
    int max_payload_size;

    std::string endpoint() const;

    void load(cereal::JSONInputArchive& archive);
    void set_defaults();
  };

  struct InvokeAPI {

    static constexpr char API_VERSION[] = "2015-03-31";
    static constexpr int DEFAULT_PORT = 9001;

    int port;

    void load(cereal::JSONInputArchive& archive);
    void set_defaults();
  };

  struct Workers {
    static constexpr int DEFAULT_THREADS_NUMBER = 8;
    // Separate pool for the worker's blocking control-plane calls (next, init error).
    static constexpr int RUNTIME_THREADS_NUMBER = 4;

    int threads;

    void load(cereal::JSONInputArchive& archive);
    void set_defaults();
  };

  struct Bootstrap {

    static constexpr int DEFAULT_READY_TIMEOUT = 5000;

    std::vector<std::string> paths;
    std::vector<std::string> args;
    // The runtime is started by someone else and connects on its own.
    bool external;
    bool capture_output;
    // Milliseconds
    int ready_timeout;

    void load(cereal::JSONInputArchive& archive);
    void set_defaults();
  };

  struct Watch {

    static constexpr int DEFAULT_DEBOUNCE = 200;

    bool enabled;
    std::vector<std::string> paths;
    // Milliseconds
    int debounce;

    void load(cereal::JSONInputArchive& archive);
    void set_defaults();
  };

  struct Emulator {

    bool verbose;
    bool stay_open;

    Function function;
    RuntimeAPI runtime_api;
    InvokeAPI invoke_api;
    Workers workers;
    Bootstrap bootstrap;
    Watch watch;

    // One-shot event sources
    std::optional<std::string> event;
    std::optional<std::string> event_file;
    bool event_stdin;

    void load(cereal::JSONInputArchive& archive);
    void load_env();
    void set_defaults();

    static Emulator deserialize(int argc, char** argv);
    static Emulator deserialize(std::istream&);
  };

} // namespace lambdalocal::emulator::config

#endif
