// ============= src/database/people_repository.cpp =============
#include "database/people_repository.hpp"
#include "utils.hpp"
#include <spdlog/spdlog.h>
#include <cctype>
#include <cstring>
#include <stdexcept>

namespace {
    const char* PERSON_COLUMNS =
        "SELECT id, person_id, name, first_seen, last_seen, interaction_count, notes FROM people ";

    Person row_to_person(const Statement& stmt) {
        Person p;
        p.id = stmt.column_int64(0);
        p.person_id = stmt.column_text(1);
        p.name = stmt.column_text(2);
        p.first_seen = stmt.column_int64(3);
        p.last_seen = stmt.column_int64(4);
        p.interaction_count = stmt.column_int(5);
        p.notes = stmt.column_text(6);
        return p;
    }
}

PeopleRepository::PeopleRepository(RobotStore& store, int embedding_size)
    : store(store), embedding_size(embedding_size) {}

// ==================== SERIALIZATION ====================

std::vector<unsigned char> PeopleRepository::serialize_embedding(const std::vector<float>& emb) {
    std::vector<unsigned char> blob(emb.size() * sizeof(float));
    if (!blob.empty()) {
        std::memcpy(blob.data(), emb.data(), blob.size());
    }
    return blob;
}

std::vector<float> PeopleRepository::deserialize_embedding(const std::vector<unsigned char>& blob) {
    std::vector<float> emb(blob.size() / sizeof(float));
    if (!emb.empty()) {
        std::memcpy(emb.data(), blob.data(), emb.size() * sizeof(float));
    }
    return emb;
}

// ==================== PEOPLE ====================

PersonLookup PeopleRepository::find_locked(const std::string& person_id) {
    PersonLookup result;

    std::string sql = std::string(PERSON_COLUMNS) + "WHERE person_id = ?";
    Statement stmt(store, sql.c_str());
    stmt.bind(1, person_id);

    if (stmt.step()) {
        result.person = row_to_person(stmt);
        result.found = true;
    }
    return result;
}

PersonLookup PeopleRepository::get_by_person_id(const std::string& person_id) {
    std::lock_guard<std::mutex> lock(store.mutex());
    return find_locked(person_id);
}

GetOrCreateResult PeopleRepository::get_or_create(const std::string& person_id, const std::string& name) {
    std::lock_guard<std::mutex> lock(store.mutex());
    Transaction tx(store);

    GetOrCreateResult result;
    int64_t now = now_ms();

    PersonLookup existing = find_locked(person_id);
    if (!existing.found) {
        Statement insert(store,
            "INSERT INTO people (person_id, name, first_seen, last_seen, interaction_count, notes) "
            "VALUES (?, ?, ?, ?, 0, '')");
        insert.bind(1, person_id).bind(2, name).bind(3, now).bind(4, now);
        insert.step();
        result.created = true;
    } else {
        Statement touch(store,
            "UPDATE people SET last_seen = ?, interaction_count = interaction_count + 1 "
            "WHERE person_id = ?");
        touch.bind(1, now).bind(2, person_id);
        touch.step();
    }

    result.person = find_locked(person_id).person;
    tx.commit();

    if (result.created) {
        spdlog::info("✓ Added person: {} ({})", result.person.name, person_id);
    }
    return result;
}

bool PeopleRepository::update_name(const std::string& person_id, const std::string& name) {
    std::lock_guard<std::mutex> lock(store.mutex());

    Statement stmt(store, "UPDATE people SET name = ? WHERE person_id = ?");
    stmt.bind(1, name).bind(2, person_id);
    stmt.step();
    return sqlite3_changes(store.handle()) > 0;
}

bool PeopleRepository::update_notes(const std::string& person_id, const std::string& notes) {
    std::lock_guard<std::mutex> lock(store.mutex());

    Statement stmt(store, "UPDATE people SET notes = ? WHERE person_id = ?");
    stmt.bind(1, notes).bind(2, person_id);
    stmt.step();
    return sqlite3_changes(store.handle()) > 0;
}

std::vector<Person> PeopleRepository::list_all() {
    std::lock_guard<std::mutex> lock(store.mutex());

    std::string sql = std::string(PERSON_COLUMNS) + "ORDER BY last_seen DESC, id DESC";
    Statement stmt(store, sql.c_str());

    std::vector<Person> people;
    while (stmt.step()) {
        people.push_back(row_to_person(stmt));
    }
    return people;
}

int PeopleRepository::count_persons() {
    std::lock_guard<std::mutex> lock(store.mutex());

    Statement stmt(store, "SELECT COUNT(*) FROM people");
    return stmt.step() ? stmt.column_int(0) : 0;
}

// ==================== EMBEDDINGS ====================

FaceEmbedding PeopleRepository::add_embedding(const std::string& person_id,
                                              const std::vector<float>& embedding,
                                              const std::string& source_lighting)
{
    if (embedding.size() != static_cast<size_t>(embedding_size)) {
        throw std::invalid_argument("Invalid embedding size: " + std::to_string(embedding.size()) +
                                    " (expected " + std::to_string(embedding_size) + ")");
    }

    std::lock_guard<std::mutex> lock(store.mutex());

    if (!find_locked(person_id).found) {
        throw StoreError("Persona '" + person_id + "' no encontrada");
    }

    FaceEmbedding record;
    record.person_id = person_id;
    record.embedding = embedding;
    record.captured_at = now_ms();
    record.source_lighting = source_lighting;

    Statement stmt(store,
        "INSERT INTO face_embeddings (person_id, embedding, captured_at, source_lighting) "
        "VALUES (?, ?, ?, ?)");
    stmt.bind(1, person_id).bind_blob(2, serialize_embedding(embedding)).bind(3, record.captured_at);
    if (source_lighting.empty()) {
        stmt.bind_null(4);
    } else {
        stmt.bind(4, source_lighting);
    }
    stmt.step();

    record.id = sqlite3_last_insert_rowid(store.handle());
    spdlog::debug("✓ Embedding {} stored for {}", record.id, person_id);
    return record;
}

std::vector<FaceEmbedding> PeopleRepository::get_embeddings(const std::string& person_id) {
    std::lock_guard<std::mutex> lock(store.mutex());

    Statement stmt(store,
        "SELECT id, person_id, embedding, captured_at, source_lighting FROM face_embeddings "
        "WHERE person_id = ? ORDER BY captured_at ASC, id ASC");
    stmt.bind(1, person_id);

    std::vector<FaceEmbedding> records;
    while (stmt.step()) {
        FaceEmbedding record;
        record.id = stmt.column_int64(0);
        record.person_id = stmt.column_text(1);
        record.embedding = deserialize_embedding(stmt.column_blob(2));
        record.captured_at = stmt.column_int64(3);
        record.source_lighting = stmt.column_text(4);
        records.push_back(record);
    }
    return records;
}

// ==================== SLUGS ====================

std::string make_person_slug(const std::string& name) {
    std::string folded;
    std::string lower = to_lower_utf8(trim(name));

    for (size_t i = 0; i < lower.size(); ++i) {
        unsigned char c = static_cast<unsigned char>(lower[i]);

        if (c < 0x80) {
            folded += std::isalnum(c) ? static_cast<char>(c) : '_';
            continue;
        }

        // á à â ä → a, é è ê ë → e, ... ñ → n (second byte of U+00E0..U+00FF)
        if (c == 0xC3 && i + 1 < lower.size()) {
            unsigned char next = static_cast<unsigned char>(lower[i + 1]);
            ++i;
            if (next >= 0xA0 && next <= 0xA5) folded += 'a';
            else if (next == 0xA7) folded += 'c';
            else if (next >= 0xA8 && next <= 0xAB) folded += 'e';
            else if (next >= 0xAC && next <= 0xAF) folded += 'i';
            else if (next == 0xB1) folded += 'n';
            else if ((next >= 0xB2 && next <= 0xB6) || next == 0xB8) folded += 'o';
            else if (next >= 0xB9 && next <= 0xBC) folded += 'u';
            else if (next == 0xBD || next == 0xBF) folded += 'y';
            else folded += '_';
            continue;
        }

        folded += '_';
    }

    // collapse runs of '_' and strip the ends
    std::string slug;
    for (char c : folded) {
        if (c == '_' && (slug.empty() || slug.back() == '_')) continue;
        slug += c;
    }
    while (!slug.empty() && slug.back() == '_') slug.pop_back();

    if (slug.empty()) slug = "desconocido";
    return "persona_" + slug;
}
