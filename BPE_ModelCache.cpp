#include "BPE_ModelCache.hpp"

#include <QDebug>
#include <QMutexLocker>

using namespace BPE;

//===================================================================================================================//

ModelCache::ModelCache(LogLevel logLevel) : logLevel(logLevel) {
}

//===================================================================================================================//

std::shared_ptr<const Backend> ModelCache::get(const Model& model, BackendType backendType) {
  QMutexLocker locker(&this->mutex);

  auto key = std::make_pair(model.id, backendType);
  auto it = this->entries.find(key);

  if (it != this->entries.end() && it->second.weightsRevision == model.weightsRevision) {
    return it->second.backend;
  }

  std::unique_ptr<Backend> backend = Backend::makeBackend(backendType, model.modelConfig, this->logLevel);
  this->loadCount++;

  if (!backend->loadWeights(model.weights)) {
    if (it != this->entries.end()) {
      this->entries.erase(it);
    }

    return nullptr;
  }

  if (this->logLevel >= LogLevel::DEBUG) {
    qDebug() << "model cache loaded model=" << QString::fromStdString(model.id)
             << "backend=" << QString::fromStdString(Backends::typeToName(backendType))
             << "revision=" << model.weightsRevision;
  }

  std::shared_ptr<const Backend> loaded(std::move(backend));
  this->entries[key] = Entry{model.weightsRevision, loaded};

  return loaded;
}

//===================================================================================================================//

void ModelCache::invalidate(const std::string& modelId) {
  QMutexLocker locker(&this->mutex);

  for (auto it = this->entries.begin(); it != this->entries.end();) {
    if (it->first.first == modelId) {
      it = this->entries.erase(it);
    } else {
      ++it;
    }
  }
}

//===================================================================================================================//

void ModelCache::clear() {
  QMutexLocker locker(&this->mutex);

  this->entries.clear();
}

//===================================================================================================================//

ulong ModelCache::size() const {
  QMutexLocker locker(&this->mutex);

  return this->entries.size();
}

//===================================================================================================================//

ulong ModelCache::getLoadCount() const {
  QMutexLocker locker(&this->mutex);

  return this->loadCount;
}

//===================================================================================================================//
