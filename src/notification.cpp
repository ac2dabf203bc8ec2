#include "notification.hpp"
#include <curl/curl.h>
#include <algorithm>
#include <chrono>
#include <cstring>
#include <format>
#include <stdexcept>

namespace {

size_t discardCallback([[maybe_unused]] void* contents, size_t size, size_t nmemb, [[maybe_unused]] void* userp) {
    return size * nmemb;
}

struct UploadSource {
    const std::string* data;
    size_t offset = 0;
};

size_t readCallback(char* buffer, size_t size, size_t nitems, void* userp) {
    auto* source = static_cast<UploadSource*>(userp);
    const size_t room = size * nitems;
    const size_t left = source->data->size() - source->offset;
    const size_t n = std::min(room, left);
    std::memcpy(buffer, source->data->data() + source->offset, n);
    source->offset += n;
    return n;
}

std::string dateHeader() {
    const auto now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm tm{};
    gmtime_r(&now, &tm);
    char buf[64];
    std::strftime(buf, sizeof(buf), "%a, %d %b %Y %H:%M:%S +0000", &tm);
    return buf;
}

} // namespace

TelegramNotificationStrategy::TelegramNotificationStrategy(const Json::Value& config)
    : botToken(config["bot_token"].asString()), chatId(config["chat_id"].asString()) {
    if (botToken.empty() || chatId.empty()) {
        throw std::runtime_error("telegram settings need bot_token and chat_id");
    }
}

std::expected<void, std::string> TelegramNotificationStrategy::notify(const std::string& subject,
                                                                      const std::string& message) {
    CURL* curl = curl_easy_init();
    if (!curl) {
        return std::unexpected("Failed to initialize CURL");
    }

    const std::string text = subject + "\n\n" + message;
    char* escapedText = curl_easy_escape(curl, text.c_str(), static_cast<int>(text.length()));
    char* escapedChat = curl_easy_escape(curl, chatId.c_str(), static_cast<int>(chatId.length()));
    if (!escapedText || !escapedChat) {
        curl_free(escapedText);
        curl_free(escapedChat);
        curl_easy_cleanup(curl);
        return std::unexpected("Failed to encode Telegram message");
    }
    const std::string url = std::format("https://api.telegram.org/bot{}/sendMessage", botToken);
    const std::string body = std::format("chat_id={}&text={}", escapedChat, escapedText);
    curl_free(escapedText);
    curl_free(escapedChat);

    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_POSTFIELDS, body.c_str());
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, discardCallback);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT, 30L);
    curl_easy_setopt(curl, CURLOPT_FAILONERROR, 1L);
    CURLcode res = curl_easy_perform(curl);
    curl_easy_cleanup(curl);
    if (res != CURLE_OK) {
        return std::unexpected(std::format("Failed to send Telegram notification: {}", curl_easy_strerror(res)));
    }
    return {};
}

EmailNotificationStrategy::EmailNotificationStrategy(SmtpConfig smtp) : smtp_(std::move(smtp)) {
    if (!smtp_.enabled()) {
        throw std::runtime_error("e-mail notifications need SMTP_HOST, SMTP_FROM and a recipient");
    }
}

std::string EmailNotificationStrategy::smtpUrl(const std::string& host) {
    if (host.starts_with("smtp://") || host.starts_with("smtps://")) {
        return host;
    }
    return "smtp://" + host;
}

std::string EmailNotificationStrategy::buildMessage(const std::string& from, const std::string& to,
                                                    const std::string& subject, const std::string& body) {
    std::string message = std::format("Date: {}\r\nTo: <{}>\r\nFrom: <{}>\r\nSubject: {}\r\n"
                                      "Content-Type: text/plain; charset=utf-8\r\n\r\n",
                                      dateHeader(), to, from, subject);
    for (char c : body) {
        if (c == '\n') {
            message += "\r\n";
        } else if (c != '\r') {
            message += c;
        }
    }
    message += "\r\n";
    return message;
}

std::expected<void, std::string> EmailNotificationStrategy::notify(const std::string& subject,
                                                                   const std::string& message) {
    CURL* curl = curl_easy_init();
    if (!curl) {
        return std::unexpected("Failed to initialize CURL");
    }

    const std::string payload = buildMessage(smtp_.from, smtp_.to, subject, message);
    UploadSource source{&payload};
    const std::string url = smtpUrl(smtp_.host);
    const std::string from = "<" + smtp_.from + ">";
    const std::string to = "<" + smtp_.to + ">";
    curl_slist* recipients = curl_slist_append(nullptr, to.c_str());

    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_USE_SSL, static_cast<long>(CURLUSESSL_TRY));
    if (!smtp_.username.empty()) {
        curl_easy_setopt(curl, CURLOPT_USERNAME, smtp_.username.c_str());
        curl_easy_setopt(curl, CURLOPT_PASSWORD, smtp_.password.c_str());
    }
    curl_easy_setopt(curl, CURLOPT_MAIL_FROM, from.c_str());
    curl_easy_setopt(curl, CURLOPT_MAIL_RCPT, recipients);
    curl_easy_setopt(curl, CURLOPT_READFUNCTION, readCallback);
    curl_easy_setopt(curl, CURLOPT_READDATA, &source);
    curl_easy_setopt(curl, CURLOPT_UPLOAD, 1L);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT, 60L);
    CURLcode res = curl_easy_perform(curl);
    curl_slist_free_all(recipients);
    curl_easy_cleanup(curl);
    if (res != CURLE_OK) {
        return std::unexpected(std::format("Failed to send e-mail to {}: {}", smtp_.to, curl_easy_strerror(res)));
    }
    return {};
}

std::vector<std::unique_ptr<NotificationStrategy>> makeNotifiers(const BackupConfig& config) {
    std::vector<std::unique_ptr<NotificationStrategy>> notifiers;
    if (config.telegramConfig.isObject() && !config.telegramConfig["bot_token"].asString().empty()) {
        notifiers.push_back(std::make_unique<TelegramNotificationStrategy>(config.telegramConfig));
    }
    if (config.smtp.enabled()) {
        notifiers.push_back(std::make_unique<EmailNotificationStrategy>(config.smtp));
    }
    return notifiers;
}
