#include "TokenSource.hpp"
#include "HttpClient.hpp"

#include "../headers/metadataFlavor.hpp"
#include "../debug/log.hpp"

#include <fmt/format.h>
#include <glaze/glaze.hpp>

constexpr const char* METADATA_TOKEN_PATH = "/computeMetadata/v1/instance/service-accounts/default/token";
// refetch this long before the server-side expiry
constexpr const std::chrono::seconds REFRESH_MARGIN{60};

struct SMetadataTokenJSON {
    std::string access_token;
    int         expires_in = 0;
    std::string token_type;
};

CStaticTokenSource::CStaticTokenSource(const std::string& token) : m_token(token) {
    ;
}

std::expected<std::string, std::string> CStaticTokenSource::token() {
    return m_token;
}

void CStaticTokenSource::invalidate() {
    Debug::log(WARN, "The configured access token was rejected, it has to be replaced by hand");
}

CMetadataTokenSource::CMetadataTokenSource(const std::string& endpoint, std::chrono::milliseconds timeout, clockFn now) : m_timeout(timeout), m_now(now) {
    std::string base = endpoint;
    while (base.ends_with("/"))
        base.pop_back();

    m_url = base + METADATA_TOKEN_PATH;

    m_client = std::make_unique<Pistache::Http::Experimental::Client>();
    m_client->init(Pistache::Http::Experimental::Client::options().threads(1).maxConnectionsPerHost(2));
}

CMetadataTokenSource::~CMetadataTokenSource() {
    if (m_client)
        m_client->shutdown();
}

const std::string& CMetadataTokenSource::url() const {
    return m_url;
}

std::expected<CMetadataTokenSource::SToken, std::string> CMetadataTokenSource::parseTokenResponse(const std::string& body) {
    SMetadataTokenJSON json;
    if (const auto ERR = glz::read<glz::opts{.error_on_unknown_keys = false}>(json, body); ERR)
        return std::unexpected(fmt::format("bad token reply: {}", glz::format_error(ERR, body)));

    if (json.access_token.empty() || json.expires_in <= 0)
        return std::unexpected("token reply without a token or expiry");

    if (!json.token_type.empty() && json.token_type != "Bearer")
        return std::unexpected(fmt::format("unexpected token type \"{}\"", json.token_type));

    return SToken{json.access_token, std::chrono::seconds(json.expires_in)};
}

std::expected<CMetadataTokenSource::SToken, std::string> CMetadataTokenSource::fetch() {
    auto builder = m_client->get(m_url);
    builder.header<MetadataFlavorHeader>();

    const auto REPLY = NHttpClient::send(builder, m_timeout);
    if (!REPLY)
        return std::unexpected(fmt::format("metadata server unreachable: {}", REPLY.error().what));

    if (REPLY->code != 200)
        return std::unexpected(fmt::format("metadata server replied {}", REPLY->code));

    return parseTokenResponse(REPLY->body);
}

std::expected<std::string, std::string> CMetadataTokenSource::token() {
    // one fetch at a time, the others wait for its result
    std::lock_guard<std::mutex> lg(m_mutex);

    if (!m_token.empty() && m_now() + REFRESH_MARGIN < m_expires)
        return m_token;

    const auto FETCHED = fetch();
    if (!FETCHED)
        return std::unexpected(FETCHED.error());

    m_token   = FETCHED->value;
    m_expires = m_now() + FETCHED->expiresIn;

    Debug::log(LOG, "Fetched an access token from the metadata server, valid for {}s", FETCHED->expiresIn.count());

    return m_token;
}

void CMetadataTokenSource::invalidate() {
    std::lock_guard<std::mutex> lg(m_mutex);
    m_token.clear();
}
