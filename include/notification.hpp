/**
 * @file notification.hpp
 * @brief Operator alerts for failed or degraded runs.
 *
 * Sends the run summary via Telegram and/or SMTP e-mail. Both channels use libcurl.
 * A failed notification is logged by the caller and never changes the run outcome.
 */

#ifndef NOTIFICATION_HPP
#define NOTIFICATION_HPP

#include <expected>
#include <memory>
#include <string>
#include <vector>
#include <json/json.h>
#include "backup_config.hpp"

/**
 * @brief Interface for notification strategies.
 */
class NotificationStrategy {
public:
    virtual ~NotificationStrategy() = default;

    /**
     * @brief Sends a notification.
     *
     * @param subject Short subject line.
     * @param message Message body.
     * @return std::expected<void, std::string> Success or an error message.
     */
    virtual std::expected<void, std::string> notify(const std::string& subject, const std::string& message) = 0;

    virtual std::string name() const = 0;
};

/**
 * @brief Telegram notification strategy using the Bot API.
 */
class TelegramNotificationStrategy : public NotificationStrategy {
public:
    /**
     * @brief Constructs a Telegram notification strategy.
     *
     * @param config JSON configuration with bot_token and chat_id.
     * @throws std::runtime_error If either value is missing.
     */
    explicit TelegramNotificationStrategy(const Json::Value& config);

    std::expected<void, std::string> notify(const std::string& subject, const std::string& message) override;
    std::string name() const override { return "telegram"; }

private:
    std::string botToken; ///< Telegram bot token.
    std::string chatId;   ///< Telegram chat ID.
};

/**
 * @brief E-mail notification strategy using SMTP.
 */
class EmailNotificationStrategy : public NotificationStrategy {
public:
    /**
     * @brief Constructs an e-mail notification strategy.
     *
     * @param smtp Server, sender, recipient and optional credentials.
     * @throws std::runtime_error If server, sender or recipient is missing.
     */
    explicit EmailNotificationStrategy(SmtpConfig smtp);

    std::expected<void, std::string> notify(const std::string& subject, const std::string& message) override;
    std::string name() const override { return "email"; }

    /**
     * @brief RFC 5322 message text (headers, blank line, body with CRLF line endings).
     */
    static std::string buildMessage(const std::string& from, const std::string& to, const std::string& subject,
                                    const std::string& body);

    /**
     * @brief SMTP URL for a configured host ("smtp.example.org:587" becomes "smtp://smtp.example.org:587").
     */
    static std::string smtpUrl(const std::string& host);

private:
    SmtpConfig smtp_;
};

/**
 * @brief Builds every configured notification channel (possibly none).
 *
 * @throws std::runtime_error If a configured channel is incomplete.
 */
std::vector<std::unique_ptr<NotificationStrategy>> makeNotifiers(const BackupConfig& config);

#endif // NOTIFICATION_HPP
