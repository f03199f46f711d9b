// ============= include/database/people_repository.hpp =============
/*
 * People Repository - personas conocidas + embeddings faciales
 *
 * TABLAS: people, face_embeddings
 *
 * OPERACIONES:
 * - get_or_create(): crea o "toca" (last_seen + interaction_count)
 * - add_embedding(): nuevo sample biométrico de una persona existente
 * - update_name() / update_notes()
 * - list_all(): ordenadas por last_seen DESC
 *
 * Los embeddings se guardan como BLOB de floats (embedding_size fijo).
 */

#pragma once
#include "database/entities.hpp"
#include "database/robot_store.hpp"
#include <string>
#include <vector>

struct PersonLookup {
    Person person;
    bool found = false;
};

struct GetOrCreateResult {
    Person person;
    bool created = false;
};

class PeopleRepository {
public:
    explicit PeopleRepository(RobotStore& store, int embedding_size = 128);

    GetOrCreateResult get_or_create(const std::string& person_id, const std::string& name);

    PersonLookup get_by_person_id(const std::string& person_id);

    bool update_name(const std::string& person_id, const std::string& name);
    bool update_notes(const std::string& person_id, const std::string& notes);

    std::vector<Person> list_all();

    // Throws StoreError if the person does not exist,
    // std::invalid_argument if the vector length is wrong
    FaceEmbedding add_embedding(const std::string& person_id,
                                const std::vector<float>& embedding,
                                const std::string& source_lighting = "");

    std::vector<FaceEmbedding> get_embeddings(const std::string& person_id);

    int count_persons();

    int get_embedding_size() const { return embedding_size; }

    // Helper para serializar embeddings
    static std::vector<unsigned char> serialize_embedding(const std::vector<float>& emb);
    static std::vector<float> deserialize_embedding(const std::vector<unsigned char>& blob);

private:
    RobotStore& store;
    int embedding_size;

    PersonLookup find_locked(const std::string& person_id);
};

// "Ana María" → "persona_ana_maria"; non-ASCII letters are folded or dropped
std::string make_person_slug(const std::string& name);
