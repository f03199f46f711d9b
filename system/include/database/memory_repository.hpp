// ============= include/database/memory_repository.hpp =============
/*
 * Memory Repository - hechos recordados por el robot
 *
 * FILTRO DE PRIVACIDAD:
 * - Antes de escribir se busca (sin mayúsculas) cada palabra sensible
 *   de la lista bilingüe: credenciales, datos bancarios, documentos, salud
 * - Si hay coincidencia save() devuelve RejectedPrivate, NO lanza excepción
 *
 * RECUPERACIÓN:
 * - get_for_scope(): persona o pool general (person_id vacío)
 * - get_recent_important(): importancia >= umbral, más recientes primero
 * - get_context_bundle(): general + persona + datos de la zona actual
 *
 * Las memorias expiradas se excluyen pero no se borran.
 */

#pragma once
#include "database/entities.hpp"
#include "database/robot_store.hpp"
#include <string>
#include <vector>

enum class SaveStatus { Stored, RejectedPrivate };

struct SaveOutcome {
    SaveStatus status = SaveStatus::Stored;
    MemoryRecord record;   // id assigned only when stored

    bool stored() const { return status == SaveStatus::Stored; }
};

struct MemoryContextBundle {
    std::vector<MemoryRecord> general;
    std::vector<MemoryRecord> personal;
    std::vector<MemoryRecord> zone;
};

// true when the text contains any sensitive keyword, in any case
bool contains_private_data(const std::string& content);

class MemoryRepository {
public:
    explicit MemoryRepository(RobotStore& store);

    // Throws StoreError only for SQL failures
    SaveOutcome save(const std::string& person_id,
                     MemoryType type,
                     const std::string& content,
                     int importance = 5,
                     int64_t zone_id = -1,
                     int64_t expires_at = 0);

    std::vector<MemoryRecord> get_for_scope(const std::string& person_id,
                                            bool include_expired = false);

    std::vector<MemoryRecord> get_recent_important(const std::string& person_id,
                                                   int min_importance = 5,
                                                   int limit = 5);

    std::vector<MemoryRecord> get_zone_facts(int64_t zone_id, int limit = 5);

    MemoryContextBundle get_context_bundle(const std::string& person_id,
                                           int64_t zone_id,
                                           int min_importance = 5,
                                           int limit = 5);

    int count();

private:
    RobotStore& store;
};

// Context text handed to the generative backend; empty when there is nothing to say
std::string format_memory_context(const MemoryContextBundle& bundle,
                                  const std::string& zone_name,
                                  const std::string& person_name);
