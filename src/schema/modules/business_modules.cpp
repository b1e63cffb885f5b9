#include "schema/schema_module.hpp"

namespace tenantcore::schema_modules {

SchemaModule clients_financial() {
    return SchemaModuleBuilder("clients_financial", "Clients, invoicing, quotations, jobs and ledger")
        .table("clients",
            "client_number TEXT,\n"
            "  name TEXT NOT NULL,\n"
            "  company_name TEXT,\n"
            "  email TEXT,\n"
            "  phone TEXT,\n"
            "  address TEXT,\n"
            "  tax_id TEXT,\n"
            "  status TEXT DEFAULT 'active',\n"
            "  agency_id UUID,\n"
            "  created_by UUID REFERENCES public.users(id)")
        .table("chart_of_accounts",
            "account_code TEXT NOT NULL,\n"
            "  account_name TEXT NOT NULL,\n"
            "  account_type TEXT NOT NULL,\n"
            "  parent_account_id UUID REFERENCES public.chart_of_accounts(id),\n"
            "  is_active BOOLEAN DEFAULT true,\n"
            "  agency_id UUID")
        .table("invoices",
            "invoice_number TEXT NOT NULL,\n"
            "  client_id UUID REFERENCES public.clients(id),\n"
            "  issue_date DATE DEFAULT CURRENT_DATE,\n"
            "  due_date DATE,\n"
            "  subtotal NUMERIC(15, 2) DEFAULT 0,\n"
            "  tax_amount NUMERIC(15, 2) DEFAULT 0,\n"
            "  total_amount NUMERIC(15, 2) DEFAULT 0,\n"
            "  status TEXT DEFAULT 'draft',\n"
            "  agency_id UUID,\n"
            "  created_by UUID REFERENCES public.users(id)")
        .table("quotation_templates",
            "name TEXT NOT NULL,\n"
            "  description TEXT,\n"
            "  template_content JSONB,\n"
            "  agency_id UUID")
        .table("quotations",
            "quote_number TEXT NOT NULL,\n"
            "  client_id UUID REFERENCES public.clients(id),\n"
            "  template_id UUID REFERENCES public.quotation_templates(id),\n"
            "  title TEXT,\n"
            "  valid_until DATE,\n"
            "  total_amount NUMERIC(15, 2) DEFAULT 0,\n"
            "  status TEXT DEFAULT 'draft',\n"
            "  agency_id UUID")
        .table("quotation_line_items",
            "quotation_id UUID NOT NULL REFERENCES public.quotations(id) ON DELETE CASCADE,\n"
            "  description TEXT NOT NULL,\n"
            "  quantity NUMERIC(10, 2) DEFAULT 1,\n"
            "  unit_price NUMERIC(15, 2) DEFAULT 0,\n"
            "  line_total NUMERIC(15, 2) DEFAULT 0,\n"
            "  sort_order INTEGER DEFAULT 0")
        .table("job_categories",
            "name TEXT NOT NULL,\n"
            "  description TEXT,\n"
            "  agency_id UUID")
        .table("jobs",
            "job_number TEXT NOT NULL,\n"
            "  title TEXT NOT NULL,\n"
            "  client_id UUID REFERENCES public.clients(id),\n"
            "  category_id UUID REFERENCES public.job_categories(id),\n"
            "  status TEXT DEFAULT 'planning',\n"
            "  start_date DATE,\n"
            "  end_date DATE,\n"
            "  estimated_cost NUMERIC(15, 2),\n"
            "  actual_cost NUMERIC(15, 2) DEFAULT 0,\n"
            "  agency_id UUID")
        .table("job_cost_items",
            "job_id UUID NOT NULL REFERENCES public.jobs(id) ON DELETE CASCADE,\n"
            "  category TEXT NOT NULL,\n"
            "  description TEXT NOT NULL,\n"
            "  quantity NUMERIC(10, 2) DEFAULT 1,\n"
            "  unit_cost NUMERIC(15, 2) DEFAULT 0,\n"
            "  total_cost NUMERIC(15, 2) DEFAULT 0")
        .table("journal_entries",
            "entry_number TEXT NOT NULL,\n"
            "  entry_date DATE DEFAULT CURRENT_DATE,\n"
            "  description TEXT,\n"
            "  reference TEXT,\n"
            "  status TEXT DEFAULT 'draft',\n"
            "  total_debit NUMERIC(15, 2) DEFAULT 0,\n"
            "  total_credit NUMERIC(15, 2) DEFAULT 0,\n"
            "  agency_id UUID,\n"
            "  created_by UUID REFERENCES public.users(id)")
        .table("journal_entry_lines",
            "journal_entry_id UUID NOT NULL REFERENCES public.journal_entries(id) ON DELETE CASCADE,\n"
            "  account_id UUID NOT NULL REFERENCES public.chart_of_accounts(id),\n"
            "  description TEXT,\n"
            "  debit_amount NUMERIC(15, 2) DEFAULT 0,\n"
            "  credit_amount NUMERIC(15, 2) DEFAULT 0,\n"
            "  line_number INTEGER")
        .index("invoices", "client_id")
        .index("quotations", "client_id")
        .index("journal_entry_lines", "journal_entry_id")
        .build();
}

SchemaModule projects_tasks() {
    return SchemaModuleBuilder("projects_tasks", "Projects, tasks and time tracking")
        .table("projects",
            "name TEXT NOT NULL,\n"
            "  description TEXT,\n"
            "  client_id UUID REFERENCES public.clients(id),\n"
            "  project_manager_id UUID REFERENCES public.users(id),\n"
            "  status TEXT DEFAULT 'planning',\n"
            "  priority TEXT DEFAULT 'medium',\n"
            "  start_date DATE,\n"
            "  end_date DATE,\n"
            "  budget NUMERIC(15, 2),\n"
            "  progress INTEGER DEFAULT 0,\n"
            "  agency_id UUID,\n"
            "  created_by UUID REFERENCES public.users(id)")
        .table("tasks",
            "project_id UUID REFERENCES public.projects(id) ON DELETE CASCADE,\n"
            "  title TEXT NOT NULL,\n"
            "  description TEXT,\n"
            "  status TEXT DEFAULT 'todo',\n"
            "  priority TEXT DEFAULT 'medium',\n"
            "  assignee_id UUID REFERENCES public.users(id),\n"
            "  due_date DATE,\n"
            "  estimated_hours NUMERIC(6, 2),\n"
            "  agency_id UUID,\n"
            "  created_by UUID REFERENCES public.users(id)")
        .table("task_assignments",
            "task_id UUID NOT NULL REFERENCES public.tasks(id) ON DELETE CASCADE,\n"
            "  user_id UUID NOT NULL REFERENCES public.users(id) ON DELETE CASCADE,\n"
            "  assigned_by UUID REFERENCES public.users(id),\n"
            "  UNIQUE (task_id, user_id)")
        .table("task_comments",
            "task_id UUID NOT NULL REFERENCES public.tasks(id) ON DELETE CASCADE,\n"
            "  user_id UUID NOT NULL REFERENCES public.users(id),\n"
            "  comment TEXT NOT NULL")
        .table("task_time_tracking",
            "task_id UUID NOT NULL REFERENCES public.tasks(id) ON DELETE CASCADE,\n"
            "  user_id UUID NOT NULL REFERENCES public.users(id),\n"
            "  start_time TIMESTAMP WITH TIME ZONE NOT NULL,\n"
            "  end_time TIMESTAMP WITH TIME ZONE,\n"
            "  hours_logged NUMERIC(6, 2),\n"
            "  description TEXT")
        .index("tasks", "project_id")
        .index("tasks", "assignee_id")
        .build();
}

SchemaModule crm() {
    return SchemaModuleBuilder("crm", "Leads, pipeline and activities")
        .table("lead_sources",
            "name TEXT NOT NULL,\n"
            "  description TEXT,\n"
            "  is_active BOOLEAN DEFAULT true,\n"
            "  agency_id UUID")
        .table("leads",
            "lead_number TEXT,\n"
            "  company_name TEXT,\n"
            "  contact_name TEXT NOT NULL,\n"
            "  email TEXT,\n"
            "  phone TEXT,\n"
            "  source_id UUID REFERENCES public.lead_sources(id),\n"
            "  status TEXT DEFAULT 'new',\n"
            "  estimated_value NUMERIC(15, 2),\n"
            "  assigned_to UUID REFERENCES public.users(id),\n"
            "  agency_id UUID")
        .table("sales_pipeline",
            "name TEXT NOT NULL,\n"
            "  stage_order INTEGER NOT NULL,\n"
            "  probability_percentage INTEGER DEFAULT 0,\n"
            "  color TEXT,\n"
            "  agency_id UUID")
        .table("crm_activities",
            "lead_id UUID REFERENCES public.leads(id) ON DELETE CASCADE,\n"
            "  client_id UUID REFERENCES public.clients(id) ON DELETE CASCADE,\n"
            "  activity_type TEXT NOT NULL,\n"
            "  subject TEXT NOT NULL,\n"
            "  description TEXT,\n"
            "  status TEXT DEFAULT 'pending',\n"
            "  due_date TIMESTAMP WITH TIME ZONE,\n"
            "  assigned_to UUID REFERENCES public.users(id),\n"
            "  agency_id UUID")
        .index("leads", "status")
        .index("crm_activities", "lead_id")
        .build();
}

SchemaModule crm_enhancements() {
    return SchemaModuleBuilder("crm_enhancements", "Segments, scoring, opportunities and email tracking")
        .table("customer_segments",
            "name TEXT NOT NULL,\n"
            "  description TEXT,\n"
            "  criteria JSONB,\n"
            "  agency_id UUID")
        .table("client_segment_assignments",
            "client_id UUID NOT NULL REFERENCES public.clients(id) ON DELETE CASCADE,\n"
            "  segment_id UUID NOT NULL REFERENCES public.customer_segments(id) ON DELETE CASCADE,\n"
            "  UNIQUE (client_id, segment_id)")
        .table("lead_scores",
            "lead_id UUID NOT NULL REFERENCES public.leads(id) ON DELETE CASCADE,\n"
            "  score INTEGER DEFAULT 0,\n"
            "  factors JSONB,\n"
            "  calculated_at TIMESTAMP WITH TIME ZONE DEFAULT NOW()")
        .table("opportunities",
            "name TEXT NOT NULL,\n"
            "  lead_id UUID REFERENCES public.leads(id),\n"
            "  client_id UUID REFERENCES public.clients(id),\n"
            "  stage TEXT DEFAULT 'prospecting',\n"
            "  amount NUMERIC(15, 2),\n"
            "  probability INTEGER DEFAULT 0,\n"
            "  expected_close_date DATE,\n"
            "  owner_id UUID REFERENCES public.users(id),\n"
            "  agency_id UUID")
        .table("email_tracking",
            "recipient_email TEXT NOT NULL,\n"
            "  subject TEXT,\n"
            "  lead_id UUID REFERENCES public.leads(id) ON DELETE SET NULL,\n"
            "  client_id UUID REFERENCES public.clients(id) ON DELETE SET NULL,\n"
            "  sent_at TIMESTAMP WITH TIME ZONE,\n"
            "  opened_at TIMESTAMP WITH TIME ZONE,\n"
            "  clicked_at TIMESTAMP WITH TIME ZONE")
        .build();
}

SchemaModule gst() {
    return SchemaModuleBuilder("gst", "GST settings, returns and transactions")
        .table("gst_settings",
            "gstin TEXT NOT NULL,\n"
            "  legal_name TEXT NOT NULL,\n"
            "  trade_name TEXT,\n"
            "  state_code TEXT,\n"
            "  filing_frequency TEXT DEFAULT 'monthly',\n"
            "  is_active BOOLEAN DEFAULT true,\n"
            "  agency_id UUID")
        .table("gst_returns",
            "return_type TEXT NOT NULL,\n"
            "  filing_period DATE NOT NULL,\n"
            "  due_date DATE,\n"
            "  status TEXT DEFAULT 'pending',\n"
            "  total_tax_liability NUMERIC(15, 2) DEFAULT 0,\n"
            "  filed_date DATE,\n"
            "  agency_id UUID")
        .table("gst_transactions",
            "invoice_id UUID REFERENCES public.invoices(id),\n"
            "  transaction_type TEXT NOT NULL,\n"
            "  transaction_date DATE NOT NULL,\n"
            "  taxable_value NUMERIC(15, 2) DEFAULT 0,\n"
            "  cgst_amount NUMERIC(15, 2) DEFAULT 0,\n"
            "  sgst_amount NUMERIC(15, 2) DEFAULT 0,\n"
            "  igst_amount NUMERIC(15, 2) DEFAULT 0,\n"
            "  agency_id UUID")
        .build();
}

SchemaModule reimbursement() {
    return SchemaModuleBuilder("reimbursement", "Expense claims and receipts")
        .table("expense_categories",
            "name TEXT NOT NULL,\n"
            "  description TEXT,\n"
            "  max_amount NUMERIC(15, 2),\n"
            "  requires_receipt BOOLEAN DEFAULT true,\n"
            "  is_active BOOLEAN DEFAULT true,\n"
            "  agency_id UUID")
        .table("reimbursement_requests",
            "employee_id UUID NOT NULL REFERENCES public.users(id),\n"
            "  category_id UUID REFERENCES public.expense_categories(id),\n"
            "  amount NUMERIC(15, 2) NOT NULL,\n"
            "  currency TEXT DEFAULT 'USD',\n"
            "  expense_date DATE NOT NULL,\n"
            "  description TEXT NOT NULL,\n"
            "  status TEXT DEFAULT 'draft',\n"
            "  reviewed_by UUID REFERENCES public.users(id),\n"
            "  reviewed_at TIMESTAMP WITH TIME ZONE,\n"
            "  agency_id UUID")
        .table("reimbursement_attachments",
            "reimbursement_id UUID NOT NULL REFERENCES public.reimbursement_requests(id) ON DELETE CASCADE,\n"
            "  file_name TEXT NOT NULL,\n"
            "  file_path TEXT NOT NULL,\n"
            "  file_type TEXT")
        .table("receipts",
            "employee_id UUID REFERENCES public.users(id),\n"
            "  file_name TEXT NOT NULL,\n"
            "  file_path TEXT NOT NULL,\n"
            "  amount NUMERIC(15, 2),\n"
            "  vendor TEXT,\n"
            "  receipt_date DATE,\n"
            "  agency_id UUID")
        .build();
}

SchemaModule financial() {
    return SchemaModuleBuilder("financial", "Currencies, banking and budgets")
        .table("currencies",
            "code TEXT NOT NULL UNIQUE,\n"
            "  name TEXT NOT NULL,\n"
            "  symbol TEXT,\n"
            "  exchange_rate NUMERIC(18, 6) DEFAULT 1,\n"
            "  is_base BOOLEAN DEFAULT false")
        .table("bank_accounts",
            "account_name TEXT NOT NULL,\n"
            "  account_number TEXT,\n"
            "  bank_name TEXT,\n"
            "  currency TEXT DEFAULT 'USD',\n"
            "  current_balance NUMERIC(15, 2) DEFAULT 0,\n"
            "  is_active BOOLEAN DEFAULT true,\n"
            "  agency_id UUID")
        .table("bank_transactions",
            "bank_account_id UUID NOT NULL REFERENCES public.bank_accounts(id) ON DELETE CASCADE,\n"
            "  transaction_date DATE NOT NULL,\n"
            "  description TEXT,\n"
            "  amount NUMERIC(15, 2) NOT NULL,\n"
            "  transaction_type TEXT,\n"
            "  is_reconciled BOOLEAN DEFAULT false")
        .table("bank_reconciliations",
            "bank_account_id UUID NOT NULL REFERENCES public.bank_accounts(id) ON DELETE CASCADE,\n"
            "  statement_date DATE NOT NULL,\n"
            "  statement_balance NUMERIC(15, 2),\n"
            "  book_balance NUMERIC(15, 2),\n"
            "  status TEXT DEFAULT 'in_progress',\n"
            "  reconciled_by UUID REFERENCES public.users(id)")
        .table("budgets",
            "name TEXT NOT NULL,\n"
            "  fiscal_year INTEGER,\n"
            "  start_date DATE,\n"
            "  end_date DATE,\n"
            "  total_amount NUMERIC(15, 2) DEFAULT 0,\n"
            "  status TEXT DEFAULT 'draft',\n"
            "  agency_id UUID")
        .table("budget_items",
            "budget_id UUID NOT NULL REFERENCES public.budgets(id) ON DELETE CASCADE,\n"
            "  account_id UUID REFERENCES public.chart_of_accounts(id),\n"
            "  category TEXT,\n"
            "  planned_amount NUMERIC(15, 2) DEFAULT 0,\n"
            "  actual_amount NUMERIC(15, 2) DEFAULT 0")
        .build();
}

SchemaModule reporting() {
    return SchemaModuleBuilder("reporting", "Custom reports, schedules and runs")
        .table("custom_reports",
            "name TEXT NOT NULL,\n"
            "  description TEXT,\n"
            "  report_type TEXT NOT NULL,\n"
            "  definition JSONB NOT NULL DEFAULT '{}'::jsonb,\n"
            "  is_public BOOLEAN DEFAULT false,\n"
            "  created_by UUID REFERENCES public.users(id),\n"
            "  agency_id UUID")
        .table("report_schedules",
            "report_id UUID NOT NULL REFERENCES public.custom_reports(id) ON DELETE CASCADE,\n"
            "  frequency TEXT NOT NULL,\n"
            "  recipients TEXT[],\n"
            "  next_run_at TIMESTAMP WITH TIME ZONE,\n"
            "  is_active BOOLEAN DEFAULT true")
        .table("report_executions",
            "report_id UUID NOT NULL REFERENCES public.custom_reports(id) ON DELETE CASCADE,\n"
            "  status TEXT DEFAULT 'running',\n"
            "  started_at TIMESTAMP WITH TIME ZONE DEFAULT NOW(),\n"
            "  completed_at TIMESTAMP WITH TIME ZONE,\n"
            "  row_count INTEGER,\n"
            "  error_message TEXT,\n"
            "  executed_by UUID REFERENCES public.users(id)")
        .build();
}

SchemaModule project_enhancements() {
    return SchemaModuleBuilder("project_enhancements", "Milestones, risks, issues, dependencies and resourcing")
        .table("project_milestones",
            "project_id UUID NOT NULL REFERENCES public.projects(id) ON DELETE CASCADE,\n"
            "  name TEXT NOT NULL,\n"
            "  due_date DATE,\n"
            "  status TEXT DEFAULT 'pending',\n"
            "  completed_at TIMESTAMP WITH TIME ZONE")
        .table("project_risks",
            "project_id UUID NOT NULL REFERENCES public.projects(id) ON DELETE CASCADE,\n"
            "  title TEXT NOT NULL,\n"
            "  probability TEXT DEFAULT 'medium',\n"
            "  impact TEXT DEFAULT 'medium',\n"
            "  mitigation_plan TEXT,\n"
            "  status TEXT DEFAULT 'open',\n"
            "  owner_id UUID REFERENCES public.users(id)")
        .table("project_issues",
            "project_id UUID NOT NULL REFERENCES public.projects(id) ON DELETE CASCADE,\n"
            "  title TEXT NOT NULL,\n"
            "  description TEXT,\n"
            "  severity TEXT DEFAULT 'medium',\n"
            "  status TEXT DEFAULT 'open',\n"
            "  assigned_to UUID REFERENCES public.users(id)")
        .table("project_dependencies",
            "project_id UUID NOT NULL REFERENCES public.projects(id) ON DELETE CASCADE,\n"
            "  depends_on_project_id UUID NOT NULL REFERENCES public.projects(id) ON DELETE CASCADE,\n"
            "  dependency_type TEXT DEFAULT 'finish_to_start'")
        .table("project_resources",
            "project_id UUID NOT NULL REFERENCES public.projects(id) ON DELETE CASCADE,\n"
            "  user_id UUID REFERENCES public.users(id),\n"
            "  role TEXT,\n"
            "  allocation_percentage INTEGER DEFAULT 100,\n"
            "  start_date DATE,\n"
            "  end_date DATE")
        .build();
}

} // namespace tenantcore::schema_modules
