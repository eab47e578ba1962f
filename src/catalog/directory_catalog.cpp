#include "directory_catalog.h"

#include <QDebug>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QJsonDocument>
#include <QJsonObject>
#include <QJsonParseError>
#include <QProcess>
#include <QSaveFile>
#include <QSet>

namespace Themis {
namespace Catalog {

namespace {

constexpr const char* ACTIVE_MARKER = ".active";

// 매니페스트 한 개 → 테마. 읽기/파싱 실패 시 nullopt
std::optional<ThemeDescriptor> readManifest(const QFileInfo& info)
{
    QFile file(info.absoluteFilePath());
    if (!file.open(QIODevice::ReadOnly)) {
        qWarning() << "[DirectoryCatalog] 매니페스트 열기 실패:" << info.fileName();
        return std::nullopt;
    }

    QJsonParseError err;
    const QJsonDocument doc = QJsonDocument::fromJson(file.readAll(), &err);
    if (err.error != QJsonParseError::NoError || !doc.isObject()) {
        qWarning() << "[DirectoryCatalog] 매니페스트 파싱 실패:" << info.fileName()
                   << err.errorString();
        return std::nullopt;
    }

    const QJsonObject obj = doc.object();
    ThemeDescriptor theme;
    theme.id = obj.value("id").toString(info.completeBaseName());
    if (theme.id.isEmpty()) theme.id = info.completeBaseName();
    theme.displayName = obj.value("name").toString(obj.value("displayName").toString());
    if (theme.displayName.isEmpty()) theme.displayName = theme.id;

    const QString note = obj.value("description").toString(obj.value("author").toString());
    if (!note.isEmpty()) theme.note = note;
    return theme;
}

} // namespace

DirectoryCatalog::DirectoryCatalog(const QString& directory,
                                   const QString& hookCommand,
                                   const QStringList& hookArguments)
    : m_directory(directory)
    , m_hookCommand(hookCommand)
    , m_hookArguments(hookArguments)
{
}

bool DirectoryCatalog::ensureDirectory() const
{
    QDir dir(m_directory);
    if (dir.exists()) return true;
    if (!dir.mkpath(".")) {
        qWarning() << "[DirectoryCatalog] 디렉토리 생성 실패:" << m_directory;
        return false;
    }
    return true;
}

QString DirectoryCatalog::activeMarkerPath() const
{
    return QDir(m_directory).filePath(QLatin1String(ACTIVE_MARKER));
}

// ============================================================
// 카탈로그
// ============================================================

QList<ThemeDescriptor> DirectoryCatalog::listThemes() const
{
    QList<ThemeDescriptor> themes;
    QDir dir(m_directory);
    if (!dir.exists()) return themes;

    QSet<QString> seen;
    const QFileInfoList manifests = dir.entryInfoList(QStringList{"*.json"}, QDir::Files, QDir::Name);
    for (const QFileInfo& info : manifests) {
        const auto theme = readManifest(info);
        if (!theme || seen.contains(theme->id)) continue;
        seen.insert(theme->id);
        themes.append(*theme);
    }

    // 매니페스트 없는 스타일시트
    const QFileInfoList sheets = dir.entryInfoList(QStringList{"*.qss"}, QDir::Files, QDir::Name);
    for (const QFileInfo& info : sheets) {
        const QString id = info.completeBaseName();
        if (seen.contains(id)) continue;
        seen.insert(id);
        themes.append(ThemeDescriptor{id, id, std::nullopt});
    }

    return themes;
}

std::optional<QString> DirectoryCatalog::activeThemeId() const
{
    QFile file(activeMarkerPath());
    if (!file.open(QIODevice::ReadOnly | QIODevice::Text)) return std::nullopt;

    const QString id = QString::fromUtf8(file.readAll()).trimmed();
    if (id.isEmpty()) return std::nullopt;
    return id;
}

// ============================================================
// 적용
// ============================================================

void DirectoryCatalog::apply(const QString& themeId)
{
    m_lastApplied = themeId;
    if (!writeActiveMarker(themeId)) return;
    runHook(themeId);
}

bool DirectoryCatalog::writeActiveMarker(const QString& themeId) const
{
    if (!ensureDirectory()) return false;

    QSaveFile file(activeMarkerPath());
    if (!file.open(QIODevice::WriteOnly | QIODevice::Text)) {
        qWarning() << "[DirectoryCatalog] .active 쓰기 실패:" << file.errorString();
        return false;
    }
    file.write(themeId.toUtf8());
    file.write("\n");
    if (!file.commit()) {
        qWarning() << "[DirectoryCatalog] .active 커밋 실패:" << file.errorString();
        return false;
    }
    return true;
}

void DirectoryCatalog::runHook(const QString& themeId) const
{
    if (m_hookCommand.isEmpty()) return;

    QStringList args = m_hookArguments;
    args << themeId;
    if (!QProcess::startDetached(m_hookCommand, args, m_directory)) {
        qWarning() << "[DirectoryCatalog] 훅 실행 실패:" << m_hookCommand;
        return;
    }
    qDebug() << "[DirectoryCatalog] 훅 실행:" << m_hookCommand << args;
}

} // namespace Catalog
} // namespace Themis
