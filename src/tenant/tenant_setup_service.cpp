#include "tenant/tenant_setup_service.hpp"
#include "db/identifier.hpp"
#include "db/scoped_transaction.hpp"
#include "core/utils.hpp"

#include <nlohmann/json.hpp>

#include <format>

namespace tenantcore {

namespace {

constexpr int kEmployeeIdProbeLimit = 1000;

std::string csv_field(const std::string& value) {
    if (value.find_first_of(",\"\n\r") == std::string::npos) {
        return value;
    }
    std::string out = "\"";
    for (char c : value) {
        if (c == '"') out += '"';
        out += c;
    }
    out += '"';
    return out;
}

std::string employee_id_for(int number) {
    return std::format("EMP-{:04d}", number);
}

std::pair<std::string, std::string> split_name(const std::string& full_name) {
    std::vector<std::string> words;
    for (const auto& p : utils::split(utils::trim(full_name), ' ')) {
        if (!p.empty()) words.push_back(p);
    }
    if (words.empty()) return {"", ""};
    std::string last;
    for (size_t i = 1; i < words.size(); ++i) {
        if (!last.empty()) last += ' ';
        last += words[i];
    }
    if (last.empty()) last = words.front();
    return {words.front(), last};
}

Result<void> exec(IDbConnection& conn, const std::string& sql, const std::vector<SqlParam>& params) {
    const auto res = run_sql(conn, sql, params);
    if (res.is_error()) {
        return Result<void>::error_from(res);
    }
    return Result<void>::ok();
}

SqlParam optional_bool(const std::optional<bool>& v) {
    if (!v) return std::nullopt;
    return std::string(*v ? "true" : "false");
}

std::optional<std::string> json_string(const nlohmann::json& j, const char* key) {
    const auto it = j.find(key);
    if (it == j.end() || it->is_null()) return std::nullopt;
    if (it->is_string()) return it->get<std::string>();
    if (it->is_number()) return it->dump();
    return std::nullopt;
}

} // namespace

Result<ExtendedSettings> extended_settings_from_json(const nlohmann::json& j) {
    if (!j.is_object()) {
        return Result<ExtendedSettings>::error(ErrorCode::INVALID_ARGUMENT,
            "Setup settings must be a JSON object");
    }

    ExtendedSettings s;
    s.company_name = json_string(j, "company_name");
    s.tagline = json_string(j, "tagline");
    s.industry = json_string(j, "industry");
    s.business_type = json_string(j, "business_type");
    s.founded_year = json_string(j, "founded_year");
    s.employee_count = json_string(j, "employee_count");
    s.description = json_string(j, "description");
    s.legal_name = json_string(j, "legal_name");
    s.registration_number = json_string(j, "registration_number");
    s.tax_id = json_string(j, "tax_id");
    s.phone = json_string(j, "phone");
    s.email = json_string(j, "email");
    s.website = json_string(j, "website");
    s.currency = json_string(j, "currency");
    s.fiscal_year_start = json_string(j, "fiscal_year_start");
    s.payment_terms = json_string(j, "payment_terms");
    s.invoice_prefix = json_string(j, "invoice_prefix");
    s.timezone = json_string(j, "timezone");
    s.date_format = json_string(j, "date_format");
    s.time_format = json_string(j, "time_format");
    s.week_start = json_string(j, "week_start");
    s.language = json_string(j, "language");

    if (const auto it = j.find("enable_gst"); it != j.end() && it->is_boolean()) {
        s.enable_gst = it->get<bool>();
    }

    if (const auto it = j.find("address"); it != j.end()) {
        if (it->is_string()) {
            s.address_text = it->get<std::string>();
        } else if (it->is_object()) {
            s.address = Address{
                .street = json_string(*it, "street"),
                .city = json_string(*it, "city"),
                .state = json_string(*it, "state"),
                .zip = json_string(*it, "zip"),
                .country = json_string(*it, "country"),
            };
        }
    }

    if (const auto it = j.find("social_links"); it != j.end() && it->is_object()) {
        for (const auto& [network, url] : it->items()) {
            if (url.is_string() && !url.get<std::string>().empty()) {
                s.social_links[network] = url.get<std::string>();
            }
        }
    }

    if (const auto it = j.find("departments"); it != j.end() && it->is_array()) {
        for (const auto& d : *it) {
            if (!d.is_object()) continue;
            s.departments.push_back({json_string(d, "name").value_or(""),
                                     json_string(d, "description").value_or("")});
        }
    }

    if (const auto it = j.find("team_members"); it != j.end() && it->is_array()) {
        for (const auto& m : *it) {
            if (!m.is_object()) continue;
            s.team_members.push_back(TeamMemberSpec{
                .name = json_string(m, "name").value_or(""),
                .email = json_string(m, "email").value_or(""),
                .phone = json_string(m, "phone"),
                .department = json_string(m, "department"),
                .title = json_string(m, "title"),
            });
        }
    }

    return Result<ExtendedSettings>::ok(std::move(s));
}

std::string TeamCredentialsManifest::to_csv() const {
    if (created.empty()) {
        return {};
    }
    std::string out = "Name,Email,Role,Department,Employee ID,Temporary Password\n";
    for (const auto& c : created) {
        out += std::format("{},{},{},{},{},{}\n",
            csv_field(c.name), csv_field(c.email), csv_field(c.role),
            csv_field(c.department), csv_field(c.employee_id), csv_field(c.temporary_password));
    }
    return out;
}

TenantSetupService::TenantSetupService(std::shared_ptr<TenantPoolRegistry> registry,
                                       std::shared_ptr<ITenantDirectory> directory,
                                       std::shared_ptr<SchemaRepairEngine> engine,
                                       std::shared_ptr<IPasswordHasher> hasher)
    : registry_(std::move(registry)),
      directory_(std::move(directory)),
      engine_(std::move(engine)),
      hasher_(std::move(hasher)) {}

Result<TeamCredentialsManifest> TenantSetupService::complete_tenant_setup(
    const std::string& database_name, const ExtendedSettings& settings) {

    const auto valid = identifier::validate_database_name(database_name);
    if (valid.is_error()) {
        return Result<TeamCredentialsManifest>::error_from(valid);
    }

    const auto found = directory_->find_by_database_name(database_name);
    if (found.is_error()) {
        return Result<TeamCredentialsManifest>::error_from(found);
    }
    if (!found.value()) {
        return Result<TeamCredentialsManifest>::error(ErrorCode::NOT_FOUND,
            std::format("No tenant owns database {}", database_name));
    }
    const TenantRecord& tenant = *found.value();

    auto acquired = registry_->acquire(database_name);
    if (acquired.is_error()) {
        return Result<TeamCredentialsManifest>::error_from(acquired);
    }
    IDbConnection& conn = **acquired.value();

    // Settings columns are added by the agencies module; make sure a tenant
    // built by an older release has them before the UPDATE below.
    if (auto ensured = engine_->ensure_module(conn, "agencies"); ensured.is_error()) {
        return Result<TeamCredentialsManifest>::error_from(ensured);
    }

    ScopedTransaction tx(conn);
    if (auto begun = tx.begin(); begun.is_error()) {
        return Result<TeamCredentialsManifest>::error_from(begun);
    }

    if (identifier::is_valid_uuid(tenant.owner_user_id)) {
        if (auto r = exec(conn,
                "INSERT INTO public.profiles (user_id, agency_id, is_active, created_at, updated_at) "
                "SELECT $1::uuid, $2::uuid, true, NOW(), NOW() "
                "WHERE EXISTS (SELECT 1 FROM public.users WHERE id = $1::uuid) "
                "ON CONFLICT (user_id) DO UPDATE SET "
                "agency_id = COALESCE(public.profiles.agency_id, EXCLUDED.agency_id), updated_at = NOW()",
                {tenant.owner_user_id, tenant.id});
            r.is_error()) {
            return Result<TeamCredentialsManifest>::error_from(r);
        }
    }

    if (auto r = update_settings(conn, tenant, settings); r.is_error()) {
        return Result<TeamCredentialsManifest>::error_from(r);
    }
    if (auto r = upsert_departments(conn, settings.departments); r.is_error()) {
        return Result<TeamCredentialsManifest>::error_from(r);
    }

    auto last_number = last_employee_number(conn);
    if (last_number.is_error()) {
        return Result<TeamCredentialsManifest>::error_from(last_number);
    }
    int next_number = last_number.value() + 1;

    TeamCredentialsManifest manifest;
    for (size_t i = 0; i < settings.team_members.size(); ++i) {
        const auto& member = settings.team_members[i];
        const std::string email = utils::to_lower(utils::trim(member.email));
        if (email.empty() || utils::trim(member.name).empty()) {
            manifest.failed.push_back({email, ErrorCode::INVALID_ARGUMENT,
                                       "Team member needs a name and an email"});
            continue;
        }

        const std::string sp = std::format("team_member_{}", i);
        if (auto r = tx.savepoint(sp); r.is_error()) {
            return Result<TeamCredentialsManifest>::error_from(r);
        }

        const auto existing = run_sql(conn,
            "SELECT id::text FROM public.users WHERE lower(email) = $1 LIMIT 1", {email});
        if (existing.is_ok() && !existing.value().empty()) {
            manifest.skipped.push_back(email);
            if (auto r = tx.release_savepoint(sp); r.is_error()) {
                return Result<TeamCredentialsManifest>::error_from(r);
            }
            continue;
        }

        auto created = existing.is_error()
            ? Result<TeamCredential>::error_from(existing)
            : create_member(conn, tenant, member, next_number);

        if (created.is_error()) {
            utils::log::warn(std::format("Setup of {}: team member {} failed: {}",
                                         database_name, email, created.error_message()));
            if (auto r = tx.rollback_to_savepoint(sp); r.is_error()) {
                acquired.value()->discard();
                return Result<TeamCredentialsManifest>::error_from(r);
            }
            manifest.failed.push_back({email, ErrorCode::PARTIAL_TEAM_MEMBER_FAILURE,
                                       created.error_message()});
            continue;
        }

        if (auto r = tx.release_savepoint(sp); r.is_error()) {
            return Result<TeamCredentialsManifest>::error_from(r);
        }
        manifest.created.push_back(std::move(created.value()));
    }

    if (auto r = tx.commit(); r.is_error()) {
        return Result<TeamCredentialsManifest>::error_from(r);
    }

    utils::log::info(std::format("Setup of {} complete: {} created, {} skipped, {} failed",
                                 database_name, manifest.created.size(),
                                 manifest.skipped.size(), manifest.failed.size()));
    return Result<TeamCredentialsManifest>::ok(std::move(manifest));
}

Result<bool> TenantSetupService::is_setup_complete(const std::string& database_name) {
    const auto valid = identifier::validate_database_name(database_name);
    if (valid.is_error()) {
        return Result<bool>::error_from(valid);
    }

    auto acquired = registry_->acquire(database_name);
    if (acquired.is_error()) {
        return Result<bool>::error_from(acquired);
    }

    const auto res = run_sql(**acquired.value(),
        "SELECT COALESCE(bool_or(setup_complete), false)::text FROM public.agency_settings");
    if (res.is_error()) {
        if (SchemaRepairEngine::is_missing_object(res.error_context())) {
            return Result<bool>::ok(false);
        }
        return Result<bool>::error_from(res);
    }
    const std::string v = res.value().scalar();
    return Result<bool>::ok(v == "t" || v == "true");
}

Result<void> TenantSetupService::update_settings(IDbConnection& conn, const TenantRecord& tenant,
                                                 const ExtendedSettings& s) {
    auto current = run_sql(conn, "SELECT id::text FROM public.agency_settings LIMIT 1");
    if (current.is_error()) {
        return Result<void>::error_from(current);
    }

    std::string settings_id = current.value().scalar();
    if (settings_id.empty()) {
        const auto inserted = run_sql(conn,
            "INSERT INTO public.agency_settings (agency_name, domain, created_at, updated_at) "
            "VALUES ($1, $2, NOW(), NOW()) RETURNING id",
            {tenant.name, tenant.domain});
        if (inserted.is_error()) {
            return Result<void>::error_from(inserted);
        }
        settings_id = inserted.value().scalar();
    }

    Address addr;
    if (s.address) {
        addr = *s.address;
    } else if (s.address_text) {
        addr = parse_address(*s.address_text);
    }

    SqlParam social;
    if (!s.social_links.empty()) {
        nlohmann::json links = nlohmann::json::object();
        for (const auto& [network, url] : s.social_links) {
            links[network] = url;
        }
        social = links.dump();
    }

    return exec(conn,
        "UPDATE public.agency_settings SET "
        "agency_name = COALESCE($1, agency_name), company_tagline = COALESCE($2, company_tagline), "
        "industry = COALESCE($3, industry), business_type = COALESCE($4, business_type), "
        "founded_year = COALESCE($5, founded_year), employee_count = COALESCE($6, employee_count), "
        "description = COALESCE($7, description), legal_name = COALESCE($8, legal_name), "
        "registration_number = COALESCE($9, registration_number), tax_id = COALESCE($10, tax_id), "
        "address_street = COALESCE($11, address_street), address_city = COALESCE($12, address_city), "
        "address_state = COALESCE($13, address_state), address_zip = COALESCE($14, address_zip), "
        "address_country = COALESCE($15, address_country), phone = COALESCE($16, phone), "
        "email = COALESCE($17, email), website = COALESCE($18, website), "
        "social_links = COALESCE($19::jsonb, social_links), currency = COALESCE($20, currency), "
        "fiscal_year_start = COALESCE($21, fiscal_year_start), "
        "default_payment_terms = COALESCE($22, default_payment_terms), "
        "invoice_prefix = COALESCE($23, invoice_prefix), "
        "enable_gst = COALESCE($24::boolean, enable_gst), timezone = COALESCE($25, timezone), "
        "date_format = COALESCE($26, date_format), time_format = COALESCE($27, time_format), "
        "week_start = COALESCE($28, week_start), language = COALESCE($29, language), "
        "setup_complete = true, updated_at = NOW() "
        "WHERE id = $30::uuid",
        {s.company_name, s.tagline, s.industry, s.business_type, s.founded_year, s.employee_count,
         s.description, s.legal_name, s.registration_number, s.tax_id,
         addr.street, addr.city, addr.state, addr.zip, addr.country,
         s.phone, s.email, s.website, social, s.currency, s.fiscal_year_start, s.payment_terms,
         s.invoice_prefix, optional_bool(s.enable_gst), s.timezone, s.date_format, s.time_format,
         s.week_start, s.language, settings_id});
}

Result<void> TenantSetupService::upsert_departments(IDbConnection& conn,
                                                    const std::vector<DepartmentSpec>& departments) {
    for (const auto& dept : departments) {
        const std::string name = utils::trim(dept.name);
        if (name.empty()) {
            continue;
        }

        const auto existing = run_sql(conn,
            "SELECT id::text FROM public.departments WHERE name = $1 LIMIT 1", {name});
        if (existing.is_error()) {
            return Result<void>::error_from(existing);
        }

        const SqlParam description = dept.description.empty()
            ? SqlParam{} : SqlParam{dept.description};
        Result<void> r = existing.value().empty()
            ? exec(conn,
                  "INSERT INTO public.departments (name, description, is_active, created_at, updated_at) "
                  "VALUES ($1, $2, true, NOW(), NOW())",
                  {name, description})
            : exec(conn,
                  "UPDATE public.departments SET description = COALESCE($2, description), "
                  "is_active = true, updated_at = NOW() WHERE id = $1::uuid",
                  {existing.value().scalar(), description});
        if (r.is_error()) {
            return r;
        }
    }
    return Result<void>::ok();
}

Result<int> TenantSetupService::last_employee_number(IDbConnection& conn) {
    const auto res = run_sql(conn,
        "SELECT COALESCE(MAX(substring(employee_id FROM '([0-9]+)$')::int), 0)::text "
        "FROM public.employee_details WHERE employee_id ~ '^EMP-[0-9]+$'");
    if (res.is_error()) {
        return Result<int>::error_from(res);
    }
    return Result<int>::ok(utils::parse_int<int>(res.value().scalar(), 0));
}

Result<TeamCredential> TenantSetupService::create_member(IDbConnection& conn, const TenantRecord& tenant,
                                                         const TeamMemberSpec& member,
                                                         int& next_employee_number) {
    const std::string name = utils::trim(member.name);
    const std::string email = utils::to_lower(utils::trim(member.email));
    const auto [first_name, last_name] = split_name(name);

    auto password = Credentials::temporary_password();
    if (password.is_error()) {
        return Result<TeamCredential>::error_from(password);
    }
    auto hashed = hasher_->hash(password.value());
    if (hashed.is_error()) {
        return Result<TeamCredential>::error_from(hashed);
    }

    const auto user = run_sql(conn,
        "INSERT INTO public.users (email, password_hash, email_confirmed, is_active, "
        "created_at, updated_at) VALUES ($1, $2, true, true, NOW(), NOW()) RETURNING id",
        {email, hashed.value()});
    if (user.is_error()) {
        return Result<TeamCredential>::error_from(user);
    }
    const std::string user_id = user.value().scalar();
    if (user_id.empty()) {
        return Result<TeamCredential>::error(ErrorCode::INTERNAL_ERROR,
            std::format("User insert for {} returned no id", email));
    }

    if (auto r = exec(conn,
            "INSERT INTO public.profiles (user_id, full_name, phone, department, position, agency_id, "
            "is_active, created_at, updated_at) VALUES ($1::uuid, $2, $3, $4, $5, $6::uuid, true, NOW(), NOW()) "
            "ON CONFLICT (user_id) DO UPDATE SET full_name = EXCLUDED.full_name, "
            "phone = EXCLUDED.phone, department = EXCLUDED.department, position = EXCLUDED.position, "
            "agency_id = COALESCE(public.profiles.agency_id, EXCLUDED.agency_id), updated_at = NOW()",
            {user_id, name, member.phone, member.department, member.title, tenant.id});
        r.is_error()) {
        return Result<TeamCredential>::error_from(r);
    }

    // Skip numbers already taken by rows that do not follow the EMP- sequence order
    int number = next_employee_number;
    for (int probe = 0; probe < kEmployeeIdProbeLimit; ++probe, ++number) {
        const auto taken = run_sql(conn,
            "SELECT 1 FROM public.employee_details WHERE employee_id = $1 LIMIT 1",
            {employee_id_for(number)});
        if (taken.is_error()) {
            return Result<TeamCredential>::error_from(taken);
        }
        if (taken.value().empty()) break;
    }
    const std::string employee_id = employee_id_for(number);

    if (auto r = exec(conn,
            "INSERT INTO public.employee_details (user_id, employee_id, agency_id, first_name, "
            "last_name, employment_type, is_active, created_at, updated_at) "
            "VALUES ($1::uuid, $2, $3::uuid, $4, $5, 'full_time', true, NOW(), NOW())",
            {user_id, employee_id, tenant.id, first_name, last_name});
        r.is_error()) {
        return Result<TeamCredential>::error_from(r);
    }

    if (auto r = exec(conn,
            "INSERT INTO public.user_roles (user_id, role, agency_id, assigned_at) "
            "VALUES ($1::uuid, $2, $3::uuid, NOW()) ON CONFLICT (user_id, role, agency_id) DO NOTHING",
            {user_id, std::string(kMemberRole), tenant.id});
        r.is_error()) {
        return Result<TeamCredential>::error_from(r);
    }

    if (member.department && !utils::trim(*member.department).empty()) {
        const auto dept = run_sql(conn,
            "SELECT id::text FROM public.departments WHERE name = $1 LIMIT 1",
            {utils::trim(*member.department)});
        if (dept.is_error()) {
            return Result<TeamCredential>::error_from(dept);
        }
        if (!dept.value().empty()) {
            if (auto r = exec(conn,
                    "INSERT INTO public.team_assignments (user_id, department_id, position_title, "
                    "role_in_department, agency_id, is_active, created_at, updated_at) "
                    "VALUES ($1::uuid, $2::uuid, $3, 'member', $4::uuid, true, NOW(), NOW())",
                    {user_id, dept.value().scalar(), member.title, tenant.id});
                r.is_error()) {
                return Result<TeamCredential>::error_from(r);
            }
        }
    }

    next_employee_number = number + 1;
    return Result<TeamCredential>::ok(TeamCredential{
        .name = name,
        .email = email,
        .role = kMemberRole,
        .department = member.department.value_or(""),
        .employee_id = employee_id,
        .temporary_password = std::move(password.value()),
    });
}

} // namespace tenantcore
