#include "schema/schema_module.hpp"

namespace tenantcore::schema_modules {

SchemaModule shared_functions() {
    return SchemaModuleBuilder("shared_functions", "Extensions, shared trigger functions and the app_role type")
        .statement("CREATE EXTENSION IF NOT EXISTS \"uuid-ossp\"")
        .statement("CREATE EXTENSION IF NOT EXISTS pgcrypto")
        .statement(
            "CREATE OR REPLACE FUNCTION public.update_updated_at_column()\n"
            "RETURNS TRIGGER AS $$\n"
            "BEGIN\n"
            "  NEW.updated_at = NOW();\n"
            "  RETURN NEW;\n"
            "END;\n"
            "$$ LANGUAGE plpgsql")
        .statement(
            "CREATE OR REPLACE FUNCTION public.current_user_id()\n"
            "RETURNS UUID AS $$\n"
            "  SELECT NULLIF(current_setting('app.current_user_id', true), '')::UUID\n"
            "$$ LANGUAGE sql STABLE")
        .statement(
            "CREATE OR REPLACE FUNCTION public.log_audit_change()\n"
            "RETURNS TRIGGER AS $$\n"
            "BEGIN\n"
            "  INSERT INTO public.audit_logs (table_name, action, user_id, record_id, old_values, new_values)\n"
            "  VALUES (TG_TABLE_NAME, TG_OP, public.current_user_id(),\n"
            "          COALESCE(NEW.id, OLD.id),\n"
            "          CASE WHEN TG_OP IN ('UPDATE', 'DELETE') THEN to_jsonb(OLD) END,\n"
            "          CASE WHEN TG_OP IN ('INSERT', 'UPDATE') THEN to_jsonb(NEW) END);\n"
            "  RETURN COALESCE(NEW, OLD);\n"
            "END;\n"
            "$$ LANGUAGE plpgsql")
        .statement(
            "DO $$\n"
            "BEGIN\n"
            "  CREATE TYPE public.app_role AS ENUM (\n"
            "    'super_admin', 'ceo', 'cto', 'cfo', 'coo', 'admin',\n"
            "    'operations_manager', 'department_head', 'team_lead',\n"
            "    'project_manager', 'hr', 'finance_manager', 'sales_manager',\n"
            "    'marketing_manager', 'quality_assurance', 'it_support',\n"
            "    'legal_counsel', 'business_analyst', 'customer_success',\n"
            "    'employee', 'contractor', 'intern');\n"
            "EXCEPTION WHEN duplicate_object THEN NULL;\n"
            "END $$")
        .build();
}

SchemaModule versioning() {
    return SchemaModuleBuilder("versioning", "Schema version bookkeeping")
        .raw_table("schema_migrations",
            "version TEXT PRIMARY KEY,\n"
            "  description TEXT,\n"
            "  applied_at TIMESTAMP WITH TIME ZONE DEFAULT NOW()")
        .raw_table("schema_info",
            "id INTEGER PRIMARY KEY DEFAULT 1,\n"
            "  schema_version TEXT NOT NULL,\n"
            "  updated_at TIMESTAMP WITH TIME ZONE DEFAULT NOW(),\n"
            "  CONSTRAINT schema_info_single_row CHECK (id = 1)")
        .build();
}

SchemaModule auth() {
    return SchemaModuleBuilder("auth", "Users, profiles, roles, permissions and audit log")
        .table("users",
            "email TEXT UNIQUE NOT NULL,\n"
            "  password_hash TEXT NOT NULL,\n"
            "  email_confirmed BOOLEAN DEFAULT false,\n"
            "  is_active BOOLEAN DEFAULT true,\n"
            "  last_sign_in_at TIMESTAMP WITH TIME ZONE,\n"
            "  raw_user_meta_data JSONB")
        .column("users", "two_factor_secret", "TEXT")
        .column("users", "two_factor_enabled", "BOOLEAN DEFAULT false")
        .column("users", "recovery_codes", "TEXT[]")
        .column("users", "password_changed_at", "TIMESTAMP WITH TIME ZONE")
        .table("profiles",
            "user_id UUID UNIQUE NOT NULL REFERENCES public.users(id) ON DELETE CASCADE,\n"
            "  agency_id UUID,\n"
            "  full_name TEXT,\n"
            "  phone TEXT,\n"
            "  department TEXT,\n"
            "  position TEXT,\n"
            "  hire_date DATE,\n"
            "  avatar_url TEXT,\n"
            "  is_active BOOLEAN DEFAULT true")
        .raw_table("user_roles",
            "id UUID PRIMARY KEY DEFAULT uuid_generate_v4(),\n"
            "  user_id UUID NOT NULL REFERENCES public.users(id) ON DELETE CASCADE,\n"
            "  role public.app_role NOT NULL,\n"
            "  agency_id UUID,\n"
            "  assigned_at TIMESTAMP WITH TIME ZONE DEFAULT NOW(),\n"
            "  assigned_by UUID REFERENCES public.users(id),\n"
            "  UNIQUE (user_id, role, agency_id)")
        .raw_table("audit_logs",
            "id UUID PRIMARY KEY DEFAULT uuid_generate_v4(),\n"
            "  table_name TEXT NOT NULL,\n"
            "  action TEXT NOT NULL,\n"
            "  user_id UUID,\n"
            "  record_id UUID,\n"
            "  old_values JSONB,\n"
            "  new_values JSONB,\n"
            "  ip_address TEXT,\n"
            "  user_agent TEXT,\n"
            "  created_at TIMESTAMP WITH TIME ZONE DEFAULT NOW()")
        .table("permissions",
            "name TEXT UNIQUE NOT NULL,\n"
            "  category TEXT NOT NULL,\n"
            "  description TEXT,\n"
            "  is_active BOOLEAN DEFAULT true")
        .table("role_permissions",
            "role public.app_role NOT NULL,\n"
            "  permission_id UUID NOT NULL REFERENCES public.permissions(id) ON DELETE CASCADE,\n"
            "  granted BOOLEAN DEFAULT true,\n"
            "  UNIQUE (role, permission_id)")
        .table("user_permissions",
            "user_id UUID NOT NULL REFERENCES public.users(id) ON DELETE CASCADE,\n"
            "  permission_id UUID NOT NULL REFERENCES public.permissions(id) ON DELETE CASCADE,\n"
            "  granted BOOLEAN DEFAULT true,\n"
            "  reason TEXT,\n"
            "  granted_by UUID REFERENCES public.users(id),\n"
            "  expires_at TIMESTAMP WITH TIME ZONE,\n"
            "  UNIQUE (user_id, permission_id)")
        .table("user_preferences",
            "user_id UUID UNIQUE NOT NULL REFERENCES public.users(id) ON DELETE CASCADE,\n"
            "  theme TEXT DEFAULT 'system',\n"
            "  language TEXT DEFAULT 'en',\n"
            "  timezone TEXT,\n"
            "  notifications JSONB DEFAULT '{}'::jsonb")
        .index("user_roles", "user_id")
        .index("profiles", "agency_id")
        .index("audit_logs", "table_name, created_at")
        .build();
}

SchemaModule agencies() {
    auto b = SchemaModuleBuilder("agencies", "Tenant-side settings row");
    b.table("agency_settings",
        "agency_name TEXT,\n"
        "  logo_url TEXT,\n"
        "  setup_complete BOOLEAN DEFAULT false");

    // Onboarding and extended profile fields, added column by column so
    // settings tables created by older releases converge too
    static constexpr const char* kColumns[][2] = {
        {"domain", "TEXT"},
        {"industry", "TEXT"},
        {"phone", "TEXT"},
        {"address_street", "TEXT"},
        {"address_city", "TEXT"},
        {"address_state", "TEXT"},
        {"address_zip", "TEXT"},
        {"address_country", "TEXT"},
        {"employee_count", "TEXT"},
        {"country", "TEXT"},
        {"timezone", "TEXT DEFAULT 'UTC'"},
        {"currency", "TEXT DEFAULT 'USD'"},
        {"language", "TEXT DEFAULT 'en'"},
        {"enable_gst", "BOOLEAN DEFAULT false"},
        {"company_tagline", "TEXT"},
        {"business_type", "TEXT"},
        {"legal_name", "TEXT"},
        {"registration_number", "TEXT"},
        {"tax_id", "TEXT"},
        {"website", "TEXT"},
        {"email", "TEXT"},
        {"description", "TEXT"},
        {"founded_year", "TEXT"},
        {"fiscal_year_start", "TEXT"},
        {"date_format", "TEXT"},
        {"time_format", "TEXT"},
        {"week_start", "TEXT"},
        {"default_payment_terms", "TEXT"},
        {"invoice_prefix", "TEXT"},
        {"invoice_footer", "TEXT"},
        {"primary_color", "TEXT"},
        {"secondary_color", "TEXT"},
        {"business_hours", "JSONB"},
        {"social_links", "JSONB"},
        {"onboarding_metadata", "JSONB"},
    };
    for (const auto& col : kColumns) {
        b.column("agency_settings", col[0], col[1]);
    }
    return b.build();
}

SchemaModule departments() {
    return SchemaModuleBuilder("departments", "Departments, hierarchy and team membership")
        .table("departments",
            "name TEXT NOT NULL,\n"
            "  description TEXT,\n"
            "  manager_id UUID REFERENCES public.users(id),\n"
            "  parent_department_id UUID REFERENCES public.departments(id),\n"
            "  agency_id UUID,\n"
            "  budget NUMERIC(15, 2) DEFAULT 0,\n"
            "  is_active BOOLEAN DEFAULT true")
        .table("department_hierarchy",
            "department_id UUID NOT NULL REFERENCES public.departments(id) ON DELETE CASCADE,\n"
            "  parent_id UUID REFERENCES public.departments(id) ON DELETE CASCADE,\n"
            "  level INTEGER DEFAULT 0,\n"
            "  path TEXT")
        .table("team_assignments",
            "user_id UUID NOT NULL REFERENCES public.users(id) ON DELETE CASCADE,\n"
            "  department_id UUID NOT NULL REFERENCES public.departments(id) ON DELETE CASCADE,\n"
            "  position_title TEXT,\n"
            "  role_in_department TEXT DEFAULT 'member',\n"
            "  reporting_to UUID REFERENCES public.users(id),\n"
            "  assigned_by UUID REFERENCES public.users(id),\n"
            "  start_date DATE DEFAULT CURRENT_DATE,\n"
            "  end_date DATE,\n"
            "  agency_id UUID,\n"
            "  is_active BOOLEAN DEFAULT true")
        .table("team_members",
            "team_lead_id UUID REFERENCES public.users(id),\n"
            "  user_id UUID NOT NULL REFERENCES public.users(id) ON DELETE CASCADE,\n"
            "  department_id UUID REFERENCES public.departments(id) ON DELETE SET NULL,\n"
            "  agency_id UUID,\n"
            "  is_active BOOLEAN DEFAULT true")
        .index("departments", "name")
        .index("team_assignments", "user_id")
        .index("team_assignments", "department_id")
        .build();
}

SchemaModule hr() {
    return SchemaModuleBuilder("hr", "Employees, attendance, leave and payroll")
        .table("attendance",
            "user_id UUID NOT NULL REFERENCES public.users(id) ON DELETE CASCADE,\n"
            "  employee_id UUID REFERENCES public.users(id) ON DELETE CASCADE,\n"
            "  date DATE NOT NULL,\n"
            "  check_in_time TIMESTAMP WITH TIME ZONE,\n"
            "  check_out_time TIMESTAMP WITH TIME ZONE,\n"
            "  status TEXT DEFAULT 'present',\n"
            "  hours_worked NUMERIC(5, 2),\n"
            "  overtime_hours NUMERIC(5, 2),\n"
            "  location TEXT,\n"
            "  ip_address TEXT,\n"
            "  agency_id UUID,\n"
            "  notes TEXT,\n"
            "  UNIQUE (user_id, date)")
        .table("employee_details",
            "user_id UUID REFERENCES public.users(id),\n"
            "  employee_id TEXT,\n"
            "  agency_id UUID,\n"
            "  first_name TEXT NOT NULL,\n"
            "  last_name TEXT NOT NULL,\n"
            "  date_of_birth DATE,\n"
            "  nationality TEXT,\n"
            "  address TEXT,\n"
            "  employment_type TEXT,\n"
            "  work_location TEXT,\n"
            "  supervisor_id UUID REFERENCES public.employee_details(id),\n"
            "  emergency_contact_name TEXT,\n"
            "  emergency_contact_phone TEXT,\n"
            "  skills JSONB,\n"
            "  notes TEXT,\n"
            "  is_active BOOLEAN DEFAULT true,\n"
            "  created_by UUID REFERENCES public.users(id)")
        .table("employee_files",
            "employee_id UUID NOT NULL REFERENCES public.users(id) ON DELETE CASCADE,\n"
            "  file_name TEXT NOT NULL,\n"
            "  file_path TEXT NOT NULL,\n"
            "  file_type TEXT,\n"
            "  category TEXT,\n"
            "  uploaded_by UUID REFERENCES public.users(id)")
        .table("employee_salary_details",
            "employee_id UUID NOT NULL REFERENCES public.users(id) ON DELETE CASCADE,\n"
            "  base_salary NUMERIC(15, 2),\n"
            "  currency TEXT DEFAULT 'USD',\n"
            "  pay_frequency TEXT DEFAULT 'monthly',\n"
            "  effective_date DATE,\n"
            "  agency_id UUID")
        .table("leave_types",
            "name TEXT NOT NULL,\n"
            "  description TEXT,\n"
            "  max_days_per_year INTEGER,\n"
            "  is_paid BOOLEAN DEFAULT true,\n"
            "  agency_id UUID,\n"
            "  is_active BOOLEAN DEFAULT true")
        .table("leave_requests",
            "employee_id UUID NOT NULL REFERENCES public.users(id) ON DELETE CASCADE,\n"
            "  leave_type_id UUID REFERENCES public.leave_types(id),\n"
            "  start_date DATE NOT NULL,\n"
            "  end_date DATE NOT NULL,\n"
            "  total_days NUMERIC(5, 1),\n"
            "  reason TEXT,\n"
            "  status TEXT DEFAULT 'pending',\n"
            "  approved_by UUID REFERENCES public.users(id),\n"
            "  approved_at TIMESTAMP WITH TIME ZONE,\n"
            "  agency_id UUID")
        .table("payroll_periods",
            "name TEXT NOT NULL,\n"
            "  start_date DATE NOT NULL,\n"
            "  end_date DATE NOT NULL,\n"
            "  pay_date DATE,\n"
            "  status TEXT DEFAULT 'draft',\n"
            "  agency_id UUID")
        .table("payroll",
            "employee_id UUID NOT NULL REFERENCES public.users(id) ON DELETE CASCADE,\n"
            "  payroll_period_id UUID REFERENCES public.payroll_periods(id),\n"
            "  base_salary NUMERIC(15, 2),\n"
            "  gross_pay NUMERIC(15, 2),\n"
            "  deductions NUMERIC(15, 2) DEFAULT 0,\n"
            "  net_pay NUMERIC(15, 2),\n"
            "  status TEXT DEFAULT 'draft',\n"
            "  agency_id UUID")
        .index("attendance", "user_id, date")
        .index("employee_details", "user_id")
        .index("leave_requests", "employee_id")
        .build();
}

SchemaModule session_management() {
    return SchemaModuleBuilder("session_management", "Durable user sessions")
        .raw_table("user_sessions",
            "id UUID PRIMARY KEY DEFAULT uuid_generate_v4(),\n"
            "  user_id UUID NOT NULL,\n"
            "  token_hash TEXT NOT NULL UNIQUE,\n"
            "  ip_address TEXT,\n"
            "  user_agent TEXT,\n"
            "  device_info JSONB,\n"
            "  is_active BOOLEAN DEFAULT true,\n"
            "  last_activity_at TIMESTAMP WITH TIME ZONE DEFAULT NOW(),\n"
            "  expires_at TIMESTAMP WITH TIME ZONE NOT NULL,\n"
            "  created_at TIMESTAMP WITH TIME ZONE DEFAULT NOW(),\n"
            "  revoked_at TIMESTAMP WITH TIME ZONE")
        .column("user_sessions", "revoke_reason", "TEXT")
        .index("user_sessions", "user_id")
        .index("user_sessions", "token_hash")
        .index("user_sessions", "expires_at")
        .index("user_sessions", "user_id, is_active, last_activity_at")
        .build();
}

} // namespace tenantcore::schema_modules
