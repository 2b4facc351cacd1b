#ifndef ARGROUTE_MANIPULATOR_HPP
#define ARGROUTE_MANIPULATOR_HPP

#include <string>

#include "token_stream.hpp"

namespace argroute {

// A rewrite pass run once over the whole stream before routing.
// Implementations must be deterministic and idempotent.
class StreamManipulator {
public:
    virtual ~StreamManipulator() = default;

    virtual void manipulate(TokenStream& stream) const = 0;
};

// -abc -> -a -b -c
// Purely syntactic: a keyed option never takes an option-like token as its value, so a
// cluster cannot be claimed by the token before it.
class ShortFlagSplitter : public StreamManipulator {
public:
    void manipulate(TokenStream& stream) const override;

    static bool isCluster(const std::string& token) {
        if (token.size() < 3) return false;
        if (token[0] != '-' || token[1] == '-') return false;
        return token.find('=') == std::string::npos;
    }
};

} // namespace argroute

#endif // ARGROUTE_MANIPULATOR_HPP
