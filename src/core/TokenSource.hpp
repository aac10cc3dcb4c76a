#pragma once

#include <chrono>
#include <expected>
#include <functional>
#include <memory>
#include <mutex>
#include <string>

#include <pistache/client.h>

// Bearer tokens for the broker. Safe to call from several handler threads at once.
class ITokenSource {
  public:
    virtual ~ITokenSource() = default;

    virtual std::expected<std::string, std::string> token() = 0;
    // the broker rejected the current token
    virtual void invalidate() = 0;
};

// PUBSUB_ACCESS_TOKEN / access_token, never refreshed
class CStaticTokenSource : public ITokenSource {
  public:
    CStaticTokenSource(const std::string& token);

    virtual std::expected<std::string, std::string> token();
    virtual void                                    invalidate();

  private:
    std::string m_token;
};

/*
    Service account tokens from the GCE / Cloud Run metadata server:
      GET {endpoint}/computeMetadata/v1/instance/service-accounts/default/token
      Metadata-Flavor: Google
      ->  {"access_token":"...","expires_in":3599,"token_type":"Bearer"}

    A token is reused until a minute before it expires.
*/
class CMetadataTokenSource : public ITokenSource {
  public:
    using clockFn = std::function<std::chrono::steady_clock::time_point()>;

    struct SToken {
        std::string          value;
        std::chrono::seconds expiresIn{0};
    };

    CMetadataTokenSource(const std::string& endpoint, std::chrono::milliseconds timeout, clockFn now = std::chrono::steady_clock::now);
    virtual ~CMetadataTokenSource();

    CMetadataTokenSource(const CMetadataTokenSource&)            = delete;
    CMetadataTokenSource& operator=(const CMetadataTokenSource&) = delete;

    virtual std::expected<std::string, std::string> token();
    virtual void                                    invalidate();

    static std::expected<SToken, std::string>       parseTokenResponse(const std::string& body);
    const std::string&                              url() const;

  private:
    std::expected<SToken, std::string>                    fetch();

    std::string                                           m_url;
    std::chrono::milliseconds                             m_timeout;
    clockFn                                               m_now;

    std::mutex                                            m_mutex;
    std::string                                           m_token;
    std::chrono::steady_clock::time_point                 m_expires;

    std::unique_ptr<Pistache::Http::Experimental::Client> m_client;
};
