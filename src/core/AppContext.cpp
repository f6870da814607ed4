#include "tinytask/core/AppContext.hpp"

#include "tinytask/core/Errors.hpp"
#include "tinytask/core/Logging.hpp"
#include "tinytask/data/DataProvider.hpp"
#include "tinytask/data/TaskCodec.hpp"
#include "tinytask/data/TaskStore.hpp"

#include <QFile>
#include <QJsonDocument>
#include <QJsonObject>
#include <QSaveFile>

namespace tinytask {
namespace core {

namespace {
const QString MarkerFileName = QStringLiteral(".disabled");
const QString DefaultReason = QStringLiteral("manually disabled");
} // namespace

AppContext::AppContext(AppSettings settings)
    : m_settings(std::move(settings))
    , m_dataProvider(std::make_unique<data::DataProvider>(m_settings.dataDirectory))
{
}

AppContext::~AppContext() = default;

const AppSettings &AppContext::settings() const
{
    return m_settings;
}

data::TaskStore &AppContext::taskStore()
{
    return m_dataProvider->taskStore();
}

std::optional<DisabledState> AppContext::disabledState() const
{
    QFile file(markerPath());
    if (!file.exists()) {
        return std::nullopt;
    }

    // An unreadable marker still disables the tool.
    DisabledState state;
    state.reason = DefaultReason;
    if (!file.open(QIODevice::ReadOnly)) {
        qCWarning(lcCli) << "cannot read" << file.fileName() << file.errorString();
        return state;
    }
    const QJsonDocument document = QJsonDocument::fromJson(file.readAll());
    if (document.isObject()) {
        const QJsonObject object = document.object();
        state.disabledAt = data::TaskCodec::parseTimestamp(object.value(QStringLiteral("disabled_at")).toString());
        const QString reason = object.value(QStringLiteral("reason")).toString();
        if (!reason.isEmpty()) {
            state.reason = reason;
        }
    }
    return state;
}

bool AppContext::isDisabled() const
{
    return QFile::exists(markerPath());
}

void AppContext::disable(const QString &reason, const QDateTime &now)
{
    QJsonObject object;
    object.insert(QStringLiteral("disabled_at"), data::TaskCodec::formatTimestamp(now));
    object.insert(QStringLiteral("reason"), reason.trimmed().isEmpty() ? DefaultReason : reason.trimmed());

    const QString path = markerPath();
    QSaveFile file(path);
    if (!file.open(QIODevice::WriteOnly)) {
        throw StorageIoError(path, file.errorString());
    }
    const QByteArray payload = QJsonDocument(object).toJson(QJsonDocument::Indented);
    if (file.write(payload) != payload.size()) {
        const QString error = file.errorString();
        file.cancelWriting();
        throw StorageIoError(path, error);
    }
    if (!file.commit()) {
        throw StorageIoError(path, file.errorString());
    }
    qCInfo(lcCli) << "disabled:" << object.value(QStringLiteral("reason")).toString();
}

void AppContext::enable()
{
    QFile file(markerPath());
    if (!file.exists()) {
        return;
    }
    if (!file.remove()) {
        throw StorageIoError(file.fileName(), file.errorString());
    }
    qCInfo(lcCli) << "enabled";
}

void AppContext::ensureEnabled() const
{
    const auto state = disabledState();
    if (state) {
        throw DisabledError(state->reason);
    }
}

QString AppContext::markerPath() const
{
    return m_dataProvider->filePath(MarkerFileName);
}

} // namespace core
} // namespace tinytask
