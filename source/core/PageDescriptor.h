#pragma once

// ============================================================================
// PageDescriptor - One page (file) of a project
// ============================================================================
// Part of the TransDesk workbench engine
// ============================================================================

#include <QString>
#include <QJsonObject>

/**
 * @brief A page of the project as listed by the project service.
 */
struct PageDescriptor {
    QString fileId;         ///< Backend file id
    int index = 0;          ///< Position in the project, also the on-disk file name
    QString name;           ///< Original file name
    QString url;            ///< Image url
    int sourceCount = 0;    ///< Markers on the page when listed

    bool isValid() const { return !fileId.isEmpty(); }

    /**
     * @brief Parse from JSON ("id", "name", "url", "source_count").
     */
    static PageDescriptor fromJson(const QJsonObject& obj, int index) {
        PageDescriptor page;
        page.fileId = obj["id"].toString();
        page.index = index;
        page.name = obj["name"].toString();
        page.url = obj["url"].toString();
        page.sourceCount = obj["source_count"].toInt();
        return page;
    }

    QJsonObject toJson() const {
        QJsonObject obj;
        obj["id"] = fileId;
        obj["name"] = name;
        obj["url"] = url;
        obj["source_count"] = sourceCount;
        return obj;
    }
};
