#include "HttpClient.hpp"
#include <QEventLoop>
#include <QNetworkAccessManager>
#include <QNetworkReply>
#include <QNetworkRequest>
#include <QTimer>
#include <QUrl>
#include "core/Logger.hpp"

namespace cal::net {

QtHttpClient::QtHttpClient() = default;

QtHttpClient::~QtHttpClient() = default;

HttpResponse QtHttpClient::get(const HttpRequest& request) {
    if (!manager_) {
        manager_ = std::make_unique<QNetworkAccessManager>();
    }

    QNetworkRequest req(QUrl(QString::fromStdString(request.url)));
    for (const auto& [name, value] : request.headers) {
        req.setRawHeader(QByteArray::fromStdString(name),
                         QByteArray::fromStdString(value));
    }
    if (!req.hasRawHeader("User-Agent")) {
        req.setRawHeader("User-Agent", kUserAgent);
    }
    req.setTransferTimeout(static_cast<int>(request.timeoutMs));

    LOG_DEBUG("HTTP GET {}", request.url);

    QNetworkReply* reply = manager_->get(req);

    // Backstop in case the transfer timeout does not fire (e.g. stuck DNS)
    bool timedOut = false;
    QEventLoop loop;
    QTimer guard;
    guard.setSingleShot(true);
    QObject::connect(&guard, &QTimer::timeout, &loop, [&]() {
        timedOut = true;
        reply->abort();
    });
    QObject::connect(reply, &QNetworkReply::finished, &loop, &QEventLoop::quit);
    guard.start(static_cast<int>(request.timeoutMs) + 500);
    if (!reply->isFinished()) {
        loop.exec();
    }
    guard.stop();

    HttpResponse response;
    QVariant statusAttr =
            reply->attribute(QNetworkRequest::HttpStatusCodeAttribute);
    auto netError = reply->error();

    if (statusAttr.isValid() && statusAttr.toInt() > 0) {
        // The server answered; 4xx/5xx are reported through status
        response.status = statusAttr.toInt();
        response.body = reply->readAll().toStdString();
    } else if (timedOut || netError == QNetworkReply::TimeoutError ||
               netError == QNetworkReply::OperationCanceledError) {
        response.error = HttpError::Timeout;
        response.errorMessage = "Request timed out after " +
                                std::to_string(request.timeoutMs) + " ms";
    } else {
        response.error = HttpError::Network;
        response.errorMessage = reply->errorString().toStdString();
    }

    reply->deleteLater();

    if (response.transportFailed()) {
        LOG_WARN("HTTP GET {} failed: {}", request.url, response.errorMessage);
    } else {
        LOG_DEBUG("HTTP GET {} -> {} ({} bytes)",
                  request.url,
                  response.status,
                  response.body.size());
    }
    return response;
}

} // namespace cal::net
