/**
 * @file directory_catalog.h
 * @brief 테마 디렉토리 기반 카탈로그 / 적용기
 *
 * 디렉토리 구조:
 *   <dir>/<name>.json   — 테마 매니페스트 {id, name, description|author}
 *   <dir>/<name>.qss    — 매니페스트 없는 스타일시트도 테마로 취급
 *   <dir>/.active       — 현재 적용된 테마 ID
 *
 * 적용 시 .active 파일을 원자적으로 갱신하고, 훅 명령이 지정되어 있으면
 * 테마 ID를 인자로 분리 실행한다 (결과는 기다리지 않음).
 */

#ifndef THEMIS_DIRECTORY_CATALOG_H
#define THEMIS_DIRECTORY_CATALOG_H

#include "theme_catalog.h"

#include <QString>
#include <QStringList>

namespace Themis {
namespace Catalog {

class DirectoryCatalog : public CatalogProvider, public ThemeApplier {
public:
    /**
     * @param directory 테마 디렉토리 경로
     * @param hookCommand 적용 후 실행할 프로그램 (빈 문자열이면 실행 안 함)
     * @param hookArguments 테마 ID 앞에 붙일 추가 인자
     */
    explicit DirectoryCatalog(const QString& directory,
                              const QString& hookCommand = QString(),
                              const QStringList& hookArguments = {});

    QList<ThemeDescriptor> listThemes() const override;
    std::optional<QString> activeThemeId() const override;
    void apply(const QString& themeId) override;

    /**
     * @brief 디렉토리가 없으면 생성
     * @return 사용 가능 여부
     */
    bool ensureDirectory() const;

    QString directory() const { return m_directory; }
    QString activeMarkerPath() const;

    /// 적용된 마지막 ID (쓰기 실패 여부와 무관)
    QString lastAppliedId() const { return m_lastApplied; }

private:
    bool writeActiveMarker(const QString& themeId) const;
    void runHook(const QString& themeId) const;

    QString m_directory;
    QString m_hookCommand;
    QStringList m_hookArguments;
    QString m_lastApplied;
};

} // namespace Catalog
} // namespace Themis

#endif // THEMIS_DIRECTORY_CATALOG_H
