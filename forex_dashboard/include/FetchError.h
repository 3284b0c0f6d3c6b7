#pragma once
#include <QString>

struct FetchError {
    enum class Kind {
        NetworkOrDecode, // transport failure or malformed/unexpected body
        PairNotFound     // well-formed response without the requested code
    };
    Kind kind = Kind::NetworkOrDecode;
    QString message;

    static FetchError networkOrDecode(const QString& msg) { return {Kind::NetworkOrDecode, msg}; }
    static FetchError pairNotFound(const QString& msg) { return {Kind::PairNotFound, msg}; }
    static QString kindName(Kind k) { return k == Kind::PairNotFound ? QStringLiteral("pair not found") : QStringLiteral("network/decode error"); }
    QString toString() const { return QString("%1: %2").arg(kindName(kind), message); }
};
