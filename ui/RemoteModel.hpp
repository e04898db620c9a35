#pragma once
#include <QAbstractTableModel>
#include <vector>
#include "opens3/StorageModel.hpp"

// Table view over the current listing of a StorageModel: Name, Size, Modified.
class RemoteModel : public QAbstractTableModel {
  Q_OBJECT
public:
  enum Column { NameColumn = 0, SizeColumn, ModifiedColumn, ColumnCount };

  explicit RemoteModel(opens3::StorageModel* model, QObject* parent = nullptr);

  int rowCount(const QModelIndex& parent = QModelIndex()) const override;
  int columnCount(const QModelIndex& parent = QModelIndex()) const override;
  QVariant data(const QModelIndex& index, int role) const override;
  QVariant headerData(int section, Qt::Orientation orientation,
                      int role) const override;
  Qt::ItemFlags flags(const QModelIndex& index) const override;

  // Lists `loc` through the storage model. On failure the model already fell
  // back to the bucket list; the rows shown are whatever that listing gave.
  bool setLocation(const opens3::Location& loc, QString* errorOut = nullptr);
  bool refresh(QString* errorOut = nullptr);
  // Enters the bucket or folder at `idx`; files are ignored.
  bool enter(const QModelIndex& idx, QString* errorOut = nullptr);
  bool goUp(QString* errorOut = nullptr);

  opens3::Location location() const { return model_->currentLocation(); }
  // "bucket/prefix/" or "" in bucket-list mode.
  QString locationText() const;

  bool isContainer(const QModelIndex& idx) const;
  QString nameAt(const QModelIndex& idx) const;
  // Object key (folders end with '/') relative to the current bucket.
  QString keyAt(const QModelIndex& idx) const;

private:
  void reset(std::vector<opens3::FSObject> entries);
  bool apply(bool ok, std::vector<opens3::FSObject>& entries,
             const opens3::OpError& err, QString* errorOut);

  opens3::StorageModel* model_ = nullptr; // not owned
  std::vector<opens3::FSObject> items_;
};
