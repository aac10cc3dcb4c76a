#pragma once

#include <string>
#include <vector>
#include <optional>
#include <functional>

#include "Request.hpp"
#include "../config/ConfigTypes.hpp"

class CConfig;

// returns the challenge token if the request is a verification handshake
using challengePredicate = std::function<std::optional<std::string>(const SIncomingRequest&)>;

struct SChallengeResponse {
    std::string body;
    std::string contentType = "text/plain";
};

/*
    Recognizes provider verification handshakes ("challenges").
    Predicates are checked in registration order, the first hit wins.
*/
class CChallengeDetector {
  public:
    CChallengeDetector() = default;
    CChallengeDetector(const CConfig& config);

    void                              addPredicate(const std::string& name, challengePredicate pred);
    void                              setReply(eChallengeReply reply, const std::string& jsonKey = "challenge");

    std::optional<SChallengeResponse> detect(const SIncomingRequest& req) const;
    size_t                            predicates() const;

  private:
    SChallengeResponse buildResponse(const SIncomingRequest& req, const std::string& token) const;

    struct SPredicate {
        std::string        name;
        challengePredicate fn;
    };

    std::vector<SPredicate> m_predicates;
    eChallengeReply         m_reply   = CHALLENGE_REPLY_BODY;
    std::string             m_jsonKey = "challenge";
};

namespace NChallenge {
    // a non-empty string, a non-zero number or true under key in a JSON object body
    challengePredicate jsonField(const std::string& key, bool requireJsonContentType = true);
    challengePredicate header(const std::string& name);
    challengePredicate queryParam(const std::string& name);
};
