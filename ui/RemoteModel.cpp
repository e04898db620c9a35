#include "RemoteModel.hpp"
#include "TimeUtils.hpp"
#include "opens3/KeyPaths.hpp"
#include <QVariant>
#include <algorithm>

RemoteModel::RemoteModel(opens3::StorageModel* model, QObject* parent)
  : QAbstractTableModel(parent), model_(model) {}

int RemoteModel::rowCount(const QModelIndex& parent) const {
  if (parent.isValid()) return 0;
  return static_cast<int>(items_.size());
}

int RemoteModel::columnCount(const QModelIndex& parent) const {
  if (parent.isValid()) return 0;
  return ColumnCount;
}

QVariant RemoteModel::data(const QModelIndex& index, int role) const {
  if (!index.isValid() || index.row() < 0 || index.row() >= (int)items_.size())
    return {};
  const auto& it = items_[index.row()];
  const bool container = it.kind != opens3::FSObjectKind::File;
  if (role == Qt::DisplayRole) {
    switch (index.column()) {
    case NameColumn:
      return QString::fromStdString(it.name) +
             (it.kind == opens3::FSObjectKind::Folder ? "/" : "");
    case SizeColumn:
      return container ? QString() : opens3ui::sizeText(it.size);
    case ModifiedColumn:
      return it.kind == opens3::FSObjectKind::Folder
                 ? QString()
                 : opens3ui::localShortTime(it.mtime);
    default:
      return {};
    }
  }
  if (role == Qt::ToolTipRole) {
    switch (it.kind) {
    case opens3::FSObjectKind::Bucket: return QStringLiteral("Bucket");
    case opens3::FSObjectKind::Folder: return QStringLiteral("Folder");
    case opens3::FSObjectKind::File: return QStringLiteral("File");
    }
  }
  if (role == Qt::UserRole && index.column() == SizeColumn) {
    return QVariant::fromValue<quint64>(it.size);
  }
  return {};
}

QVariant RemoteModel::headerData(int section, Qt::Orientation orientation,
                                 int role) const {
  if (orientation != Qt::Horizontal || role != Qt::DisplayRole) return {};
  switch (section) {
  case NameColumn: return QStringLiteral("Name");
  case SizeColumn: return QStringLiteral("Size");
  case ModifiedColumn: return QStringLiteral("Modified");
  default: return {};
  }
}

Qt::ItemFlags RemoteModel::flags(const QModelIndex& index) const {
  if (!index.isValid()) return Qt::NoItemFlags;
  return Qt::ItemIsEnabled | Qt::ItemIsSelectable;
}

void RemoteModel::reset(std::vector<opens3::FSObject> entries) {
  // Containers first, then by name.
  std::stable_sort(entries.begin(), entries.end(),
                   [](const opens3::FSObject& a, const opens3::FSObject& b) {
                     const bool ca = a.kind != opens3::FSObjectKind::File;
                     const bool cb = b.kind != opens3::FSObjectKind::File;
                     if (ca != cb) return ca;
                     return a.name < b.name;
                   });
  beginResetModel();
  items_ = std::move(entries);
  endResetModel();
}

bool RemoteModel::apply(bool ok, std::vector<opens3::FSObject>& entries,
                        const opens3::OpError& err, QString* errorOut) {
  reset(std::move(entries));
  if (!ok && errorOut) *errorOut = QString::fromStdString(err.describe());
  return ok;
}

bool RemoteModel::setLocation(const opens3::Location& loc, QString* errorOut) {
  if (!model_) {
    if (errorOut) *errorOut = QStringLiteral("No storage model");
    return false;
  }
  std::vector<opens3::FSObject> out;
  opens3::OpError err;
  const bool ok = model_->navigate(loc, out, err);
  return apply(ok, out, err, errorOut);
}

bool RemoteModel::refresh(QString* errorOut) {
  return setLocation(model_ ? model_->currentLocation() : opens3::Location{},
                     errorOut);
}

bool RemoteModel::enter(const QModelIndex& idx, QString* errorOut) {
  if (!model_ || !isContainer(idx)) return false;
  const auto& it = items_[idx.row()];
  std::vector<opens3::FSObject> out;
  opens3::OpError err;
  const bool ok = it.kind == opens3::FSObjectKind::Bucket
                      ? model_->enterBucket(it.name, out, err)
                      : model_->enterFolder(it.name, out, err);
  return apply(ok, out, err, errorOut);
}

bool RemoteModel::goUp(QString* errorOut) {
  if (!model_) return false;
  std::vector<opens3::FSObject> out;
  opens3::OpError err;
  const bool ok = model_->goUp(out, err);
  return apply(ok, out, err, errorOut);
}

QString RemoteModel::locationText() const {
  if (!model_) return {};
  const opens3::Location loc = model_->currentLocation();
  if (loc.isBucketList()) return {};
  return QString::fromStdString(loc.bucket + "/" + loc.prefix);
}

bool RemoteModel::isContainer(const QModelIndex& idx) const {
  if (!idx.isValid() || idx.row() >= (int)items_.size()) return false;
  return items_[idx.row()].kind != opens3::FSObjectKind::File;
}

QString RemoteModel::nameAt(const QModelIndex& idx) const {
  if (!idx.isValid() || idx.row() >= (int)items_.size()) return {};
  return QString::fromStdString(items_[idx.row()].name);
}

QString RemoteModel::keyAt(const QModelIndex& idx) const {
  if (!model_ || !idx.isValid() || idx.row() >= (int)items_.size()) return {};
  const auto& it = items_[idx.row()];
  const std::string prefix = model_->currentLocation().prefix;
  if (it.kind == opens3::FSObjectKind::Folder)
    return QString::fromStdString(opens3::childPrefix(prefix, it.name));
  if (it.kind == opens3::FSObjectKind::Bucket)
    return {};
  return QString::fromStdString(prefix + it.name);
}
