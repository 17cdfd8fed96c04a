#include <chrono>
#include <iostream>
#include <string>

#include "argbind/argbind.hpp"

// Run as `APP_ADDR=:8080 env_example -db postgres://...`. Flags win over the environment.
struct ServerConfig {
    std::string addr;
    std::string db;
    std::chrono::nanoseconds timeout{std::chrono::seconds(30)};
    std::string token;

    static void describe(argbind::Schema<ServerConfig>& s) {
        s.field("Addr", &ServerConfig::addr).flag("addr").env("ADDR").envDefault(":80");
        s.field("DB", &ServerConfig::db).flag("db").env("DB");
        s.field("Timeout", &ServerConfig::timeout).flag("timeout").env("TIMEOUT");
        s.field("Token", &ServerConfig::token).env("TOKEN").required();
    }

    std::optional<std::string> validate() {
        if (db.empty()) return std::string("db must be set");
        return std::nullopt;
    }
};

int main(int argc, char** argv) {
    argbind::Parser::Options opts;
    opts.envVars = true;
    opts.envPrefix = "APP_";

    ServerConfig cfg;
    if (auto err = argbind::Parser(opts).parse(argc, argv, &cfg)) {
        std::cerr << "error: " << *err << "\n";
        return static_cast<int>(argbind::ExitCode::InvalidArgs);
    }

    std::cout << "addr=" << cfg.addr << "\n";
    std::cout << "db=" << cfg.db << "\n";
    std::cout << "timeout_ms=" << std::chrono::duration_cast<std::chrono::milliseconds>(cfg.timeout).count() << "\n";
    return 0;
}
