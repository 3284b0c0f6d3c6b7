#include <QCoreApplication>
#include <QJsonDocument>
#include <QJsonObject>
#include <iostream>
#include <memory>

#include "FakeTransport.h"
#include "RateClient.h"

namespace {

const QString kBaseUrl = "https://v6.exchangerate-api.com";

// Deterministic, distinct rate per (base, target)
double syntheticRate(int baseIdx, int targetIdx) { return 0.5 + baseIdx * 0.01 + targetIdx * 0.0001; }

QByteArray latestBody(int baseIdx) {
    QJsonObject rates;
    const auto& codes = supportedCurrencies();
    for (int i = 0; i < codes.size(); ++i) rates[codes[i]] = syntheticRate(baseIdx, i);
    return QJsonDocument(QJsonObject{{"result", "success"}, {"conversion_rates", rates}}).toJson(QJsonDocument::Compact);
}

bool expect(bool cond, const char* what) {
    if (!cond) std::cerr << "FAILED: " << what << std::endl;
    return cond;
}

}  // namespace

int main(int argc, char** argv) {
    QCoreApplication app(argc, argv);
    bool ok = true;
    auto fake = std::make_shared<FakeTransport>();
    RateClient client(fake, kBaseUrl);

    // URL shape
    ok &= expect(client.latestUrl("test-key", "USD").toString() == "https://v6.exchangerate-api.com/v6/test-key/latest/USD",
                 "latest URL embeds key and base");

    // Rate matches conversion_rates[target] for every base, checked against several targets
    {
        const auto& codes = supportedCurrencies();
        fake->setHandler([&codes](const QUrl& url, int) {
            const QString base = url.path().section('/', -1);
            return FakeTransport::json(latestBody(int(codes.indexOf(base))));
        });
        int mismatches = 0;
        for (int b = 0; b < codes.size(); ++b) {
            for (int t : {0, b, (b + 1) % int(codes.size()), int(codes.size()) - 1}) {
                FetchError err;
                auto rate = client.fetchPointRate("k", {codes[b], codes[t]}, &err);
                if (!rate || *rate != syntheticRate(b, t)) {
                    if (mismatches++ < 5) std::cerr << "  mismatch for " << qPrintable(codes[b] + codes[t]) << std::endl;
                }
            }
        }
        ok &= expect(mismatches == 0, "rate equals conversion_rates[target] for supported pairs");
        ok &= expect(fake->urls().last().path().endsWith("/latest/" + codes.last()), "request uses the base code");
    }

    // 0.92 example
    {
        fake->setHandler([](const QUrl&, int) { return FakeTransport::json(R"({"conversion_rates":{"EUR":0.92}})"); });
        FetchError err;
        auto rate = client.fetchPointRate("k", {"USD", "EUR"}, &err);
        ok &= expect(rate && *rate == 0.92, "USD->EUR returns 0.92");
    }

    // Missing target -> PairNotFound
    {
        fake->setHandler([](const QUrl&, int) { return FakeTransport::json(R"({"conversion_rates":{"GBP":0.79}})"); });
        FetchError err;
        auto rate = client.fetchPointRate("k", {"USD", "EUR"}, &err);
        ok &= expect(!rate, "missing target yields no value");
        ok &= expect(err.kind == FetchError::Kind::PairNotFound, "missing target is PairNotFound");
    }

    // Transport failure -> NetworkOrDecode carrying the message
    {
        fake->setHandler([](const QUrl&, int) { return FakeTransport::transportFailure("Host v6.exchangerate-api.com not found"); });
        FetchError err;
        auto rate = client.fetchPointRate("k", {"USD", "EUR"}, &err);
        ok &= expect(!rate && err.kind == FetchError::Kind::NetworkOrDecode, "transport failure is NetworkOrDecode");
        ok &= expect(err.message.contains("not found"), "transport message is carried");
    }

    // Non-JSON body -> NetworkOrDecode
    {
        fake->setHandler([](const QUrl&, int) { return FakeTransport::json("<html>502 Bad Gateway</html>", 502); });
        FetchError err;
        auto rate = client.fetchPointRate("k", {"USD", "EUR"}, &err);
        ok &= expect(!rate && err.kind == FetchError::Kind::NetworkOrDecode, "non-JSON body is NetworkOrDecode");
    }

    // Service error envelope, no conversion_rates -> NetworkOrDecode naming the error-type
    {
        fake->setHandler([](const QUrl&, int) { return FakeTransport::json(R"({"result":"error","error-type":"invalid-key"})", 403); });
        FetchError err;
        auto rate = client.fetchPointRate("bad", {"USD", "EUR"}, &err);
        ok &= expect(!rate && err.kind == FetchError::Kind::NetworkOrDecode, "error envelope is NetworkOrDecode");
        ok &= expect(err.message.contains("invalid-key"), "error envelope type is reported");
    }

    // Non-numeric rate -> NetworkOrDecode, not PairNotFound
    {
        fake->setHandler([](const QUrl&, int) { return FakeTransport::json(R"({"conversion_rates":{"EUR":"0.92"}})"); });
        FetchError err;
        auto rate = client.fetchPointRate("k", {"USD", "EUR"}, &err);
        ok &= expect(!rate && err.kind == FetchError::Kind::NetworkOrDecode, "string rate is a decode error");
    }

    // Null error pointer is allowed
    {
        fake->setHandler([](const QUrl&, int) { return FakeTransport::json("[]"); });
        ok &= expect(!client.fetchPointRate("k", {"USD", "EUR"}, nullptr), "array body fails without error sink");
    }

    if (!ok) return 1;
    std::cout << "test_rate_client passed" << std::endl;
    return 0;
}
