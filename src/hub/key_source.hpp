#pragma once

#include <spdlog/spdlog.h>
#include <chrono>
#include <map>
#include <memory>
#include <string>

namespace httplib { class Client; }

namespace beacon {

using public_key_map = std::map<std::string, std::string>;

// Where monitor public keys come from.
class key_source {
public:
    virtual ~key_source() = default;

    // Complete source_id -> base64 public key map. Throws std::runtime_error on failure.
    virtual public_key_map fetch() = 0;

    // True if fetch() can return different keys over time.
    virtual bool refreshable() const = 0;

    virtual std::string describe() const = 0;
};

// Keys from configuration; never changes.
class static_key_source : public key_source {
public:
    explicit static_key_source(public_key_map keys) : m_keys(std::move(keys)) {}

    public_key_map fetch() override { return m_keys; }
    bool refreshable() const override { return false; }
    std::string describe() const override { return "static configuration"; }

private:
    public_key_map m_keys;
};

// GET <endpoint> returning {"keys":[{"source_id":..., "public_key":...}]},
// with an optional apikey header. Blocking; call from a thread that may block.
class http_key_source : public key_source {
public:
    http_key_source(const std::string& endpoint, std::string api_key,
                    std::chrono::seconds timeout);
    ~http_key_source() override;

    public_key_map fetch() override;
    bool refreshable() const override { return true; }
    std::string describe() const override { return m_endpoint; }

private:
    std::string m_endpoint;
    std::string m_path;
    std::string m_api_key;
    std::unique_ptr<httplib::Client> m_client;
};

// Parses the key endpoint document. Throws std::runtime_error on a bad shape.
public_key_map parse_key_document(const std::string& body);

} // namespace beacon
