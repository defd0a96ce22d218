// TrustStore.h — Постоянное хранилище сопряжённых устройств
// Файл состояния — единственный источник истины: каждая мутация = load → modify → save

#pragma once

#include "export.h"
#include "Models.h"
#include "Types.h"
#include <string>
#include <map>
#include <memory>
#include <optional>

namespace OreonPickup {

// ═══════════════════════════════════════════════════════════
// TrustState — содержимое state файла
// ═══════════════════════════════════════════════════════════

struct TrustState {
    /// "paired_devices": deviceId → запись
    std::map<std::string, PairedDevice> pairedDevices;

    /// Прочие ключи верхнего уровня (принадлежат другим компонентам).
    /// Ключ → JSON текст значения, сохраняется без изменений.
    std::map<std::string, std::string> otherFields;
};

// ═══════════════════════════════════════════════════════════
// TrustStore
// ═══════════════════════════════════════════════════════════

/// Операции сериализованы внутри процесса (mutex на путь файла).
/// Запись идёт во временный файл + rename, поэтому сбой не оставляет
/// полузаписанный state. Параллельные писатели из других процессов
/// не координируются.
class OP_API TrustStore {
public:
    explicit TrustStore(const std::string& stateFile);
    ~TrustStore();

    // Запрет копирования
    TrustStore(const TrustStore&) = delete;
    TrustStore& operator=(const TrustStore&) = delete;

    /// Путь к state файлу
    const std::string& getPath() const;

    /// Прочитать состояние. Нет файла или файл битый → пустое состояние
    /// (битый файл логируется и копируется в <path>.corrupt).
    TrustState load() const;

    /// Записать полное состояние
    /// @return false при ошибке записи (см. getLastError)
    bool save(const TrustState& state);

    /// load → upsert → save, last-writer-wins по deviceId
    bool addOrUpdate(const std::string& deviceId, const PairedDevice& record);

    /// load → delete → save. Отсутствующий id — предупреждение, не ошибка.
    bool remove(const std::string& deviceId);

    /// Только paired_devices
    std::map<std::string, PairedDevice> list() const;

    std::optional<PairedDevice> get(const std::string& deviceId) const;

    bool isPaired(const std::string& deviceId) const;

    /// Последняя ошибка
    PickupError getLastErrorCode() const;
    std::string getLastError() const;

private:
    class Impl;
    std::unique_ptr<Impl> m_impl;
};

} // namespace OreonPickup
