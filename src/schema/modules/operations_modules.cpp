#include "schema/schema_module.hpp"

namespace tenantcore::schema_modules {

SchemaModule inventory() {
    return SchemaModuleBuilder("inventory", "Warehouses, products, stock and bills of materials")
        .table("warehouses",
            "code TEXT NOT NULL,\n"
            "  name TEXT NOT NULL,\n"
            "  address TEXT,\n"
            "  is_active BOOLEAN DEFAULT true,\n"
            "  agency_id UUID")
        .table("product_categories",
            "name TEXT NOT NULL,\n"
            "  parent_id UUID REFERENCES public.product_categories(id),\n"
            "  description TEXT,\n"
            "  agency_id UUID")
        .table("products",
            "sku TEXT NOT NULL,\n"
            "  name TEXT NOT NULL,\n"
            "  description TEXT,\n"
            "  category_id UUID REFERENCES public.product_categories(id),\n"
            "  unit_of_measure TEXT DEFAULT 'unit',\n"
            "  cost_price NUMERIC(15, 2) DEFAULT 0,\n"
            "  selling_price NUMERIC(15, 2) DEFAULT 0,\n"
            "  reorder_level NUMERIC(15, 2) DEFAULT 0,\n"
            "  is_active BOOLEAN DEFAULT true,\n"
            "  agency_id UUID")
        .table("product_variants",
            "product_id UUID NOT NULL REFERENCES public.products(id) ON DELETE CASCADE,\n"
            "  sku TEXT NOT NULL,\n"
            "  attributes JSONB,\n"
            "  price_adjustment NUMERIC(15, 2) DEFAULT 0")
        .table("suppliers",
            "name TEXT NOT NULL,\n"
            "  contact_name TEXT,\n"
            "  email TEXT,\n"
            "  phone TEXT,\n"
            "  address TEXT,\n"
            "  payment_terms INTEGER DEFAULT 30,\n"
            "  rating NUMERIC(3, 2),\n"
            "  is_active BOOLEAN DEFAULT true,\n"
            "  agency_id UUID")
        .table("inventory",
            "product_id UUID NOT NULL REFERENCES public.products(id) ON DELETE CASCADE,\n"
            "  warehouse_id UUID NOT NULL REFERENCES public.warehouses(id) ON DELETE CASCADE,\n"
            "  quantity NUMERIC(15, 2) DEFAULT 0,\n"
            "  reserved_quantity NUMERIC(15, 2) DEFAULT 0,\n"
            "  UNIQUE (product_id, warehouse_id)")
        .table("inventory_transactions",
            "inventory_id UUID NOT NULL REFERENCES public.inventory(id) ON DELETE CASCADE,\n"
            "  transaction_type TEXT NOT NULL,\n"
            "  quantity NUMERIC(15, 2) NOT NULL,\n"
            "  reference_type TEXT,\n"
            "  reference_id UUID,\n"
            "  notes TEXT,\n"
            "  created_by UUID REFERENCES public.users(id)")
        .table("bom",
            "product_id UUID NOT NULL REFERENCES public.products(id) ON DELETE CASCADE,\n"
            "  name TEXT NOT NULL,\n"
            "  version TEXT DEFAULT '1.0',\n"
            "  is_active BOOLEAN DEFAULT true")
        .table("bom_items",
            "bom_id UUID NOT NULL REFERENCES public.bom(id) ON DELETE CASCADE,\n"
            "  component_id UUID NOT NULL REFERENCES public.products(id),\n"
            "  quantity NUMERIC(15, 4) NOT NULL DEFAULT 1")
        .table("serial_numbers",
            "product_id UUID NOT NULL REFERENCES public.products(id) ON DELETE CASCADE,\n"
            "  serial_number TEXT NOT NULL,\n"
            "  warehouse_id UUID REFERENCES public.warehouses(id),\n"
            "  status TEXT DEFAULT 'available'")
        .table("batches",
            "product_id UUID NOT NULL REFERENCES public.products(id) ON DELETE CASCADE,\n"
            "  batch_number TEXT NOT NULL,\n"
            "  manufacture_date DATE,\n"
            "  expiry_date DATE,\n"
            "  quantity NUMERIC(15, 2) DEFAULT 0")
        .index("inventory", "warehouse_id")
        .index("inventory_transactions", "inventory_id")
        .build();
}

SchemaModule procurement() {
    return SchemaModuleBuilder("procurement", "Requisitions, purchase orders, receipts, RFQs and vendors")
        .table("purchase_requisitions",
            "requisition_number TEXT NOT NULL,\n"
            "  requested_by UUID REFERENCES public.users(id),\n"
            "  department_id UUID REFERENCES public.departments(id),\n"
            "  status TEXT DEFAULT 'draft',\n"
            "  required_date DATE,\n"
            "  total_amount NUMERIC(15, 2) DEFAULT 0,\n"
            "  agency_id UUID")
        .table("purchase_requisition_items",
            "requisition_id UUID NOT NULL REFERENCES public.purchase_requisitions(id) ON DELETE CASCADE,\n"
            "  product_id UUID REFERENCES public.products(id),\n"
            "  description TEXT,\n"
            "  quantity NUMERIC(15, 2) NOT NULL,\n"
            "  estimated_unit_price NUMERIC(15, 2)")
        .table("purchase_orders",
            "po_number TEXT NOT NULL,\n"
            "  supplier_id UUID REFERENCES public.suppliers(id),\n"
            "  requisition_id UUID REFERENCES public.purchase_requisitions(id),\n"
            "  order_date DATE DEFAULT CURRENT_DATE,\n"
            "  expected_delivery_date DATE,\n"
            "  status TEXT DEFAULT 'draft',\n"
            "  total_amount NUMERIC(15, 2) DEFAULT 0,\n"
            "  agency_id UUID")
        .table("purchase_order_items",
            "po_id UUID NOT NULL REFERENCES public.purchase_orders(id) ON DELETE CASCADE,\n"
            "  product_id UUID REFERENCES public.products(id),\n"
            "  description TEXT,\n"
            "  quantity NUMERIC(15, 2) NOT NULL,\n"
            "  unit_price NUMERIC(15, 2) NOT NULL,\n"
            "  received_quantity NUMERIC(15, 2) DEFAULT 0")
        .table("goods_receipts",
            "grn_number TEXT NOT NULL,\n"
            "  po_id UUID REFERENCES public.purchase_orders(id),\n"
            "  warehouse_id UUID REFERENCES public.warehouses(id),\n"
            "  received_date DATE DEFAULT CURRENT_DATE,\n"
            "  received_by UUID REFERENCES public.users(id),\n"
            "  status TEXT DEFAULT 'pending'")
        .table("grn_items",
            "grn_id UUID NOT NULL REFERENCES public.goods_receipts(id) ON DELETE CASCADE,\n"
            "  po_item_id UUID REFERENCES public.purchase_order_items(id),\n"
            "  quantity_received NUMERIC(15, 2) NOT NULL,\n"
            "  quantity_accepted NUMERIC(15, 2),\n"
            "  quantity_rejected NUMERIC(15, 2) DEFAULT 0")
        .table("rfq_rfp",
            "rfq_number TEXT NOT NULL,\n"
            "  title TEXT NOT NULL,\n"
            "  description TEXT,\n"
            "  closing_date DATE,\n"
            "  status TEXT DEFAULT 'draft',\n"
            "  agency_id UUID")
        .table("rfq_items",
            "rfq_id UUID NOT NULL REFERENCES public.rfq_rfp(id) ON DELETE CASCADE,\n"
            "  product_id UUID REFERENCES public.products(id),\n"
            "  description TEXT,\n"
            "  quantity NUMERIC(15, 2) NOT NULL")
        .table("rfq_responses",
            "rfq_id UUID NOT NULL REFERENCES public.rfq_rfp(id) ON DELETE CASCADE,\n"
            "  supplier_id UUID NOT NULL REFERENCES public.suppliers(id),\n"
            "  submitted_at TIMESTAMP WITH TIME ZONE,\n"
            "  total_amount NUMERIC(15, 2),\n"
            "  status TEXT DEFAULT 'submitted'")
        .table("rfq_response_items",
            "response_id UUID NOT NULL REFERENCES public.rfq_responses(id) ON DELETE CASCADE,\n"
            "  rfq_item_id UUID NOT NULL REFERENCES public.rfq_items(id),\n"
            "  unit_price NUMERIC(15, 2) NOT NULL,\n"
            "  lead_time_days INTEGER")
        .table("vendor_contacts",
            "supplier_id UUID NOT NULL REFERENCES public.suppliers(id) ON DELETE CASCADE,\n"
            "  name TEXT NOT NULL,\n"
            "  email TEXT,\n"
            "  phone TEXT,\n"
            "  is_primary BOOLEAN DEFAULT false")
        .table("vendor_contracts",
            "supplier_id UUID NOT NULL REFERENCES public.suppliers(id) ON DELETE CASCADE,\n"
            "  contract_number TEXT NOT NULL,\n"
            "  start_date DATE,\n"
            "  end_date DATE,\n"
            "  value NUMERIC(15, 2),\n"
            "  status TEXT DEFAULT 'active'")
        .table("vendor_performance",
            "supplier_id UUID NOT NULL REFERENCES public.suppliers(id) ON DELETE CASCADE,\n"
            "  period_start DATE,\n"
            "  period_end DATE,\n"
            "  on_time_delivery_rate NUMERIC(5, 2),\n"
            "  quality_score NUMERIC(5, 2)")
        .table("vendor_invoices",
            "supplier_id UUID NOT NULL REFERENCES public.suppliers(id),\n"
            "  po_id UUID REFERENCES public.purchase_orders(id),\n"
            "  invoice_number TEXT NOT NULL,\n"
            "  invoice_date DATE,\n"
            "  due_date DATE,\n"
            "  amount NUMERIC(15, 2) NOT NULL,\n"
            "  status TEXT DEFAULT 'pending'")
        .index("purchase_orders", "supplier_id")
        .build();
}

SchemaModule webhooks() {
    return SchemaModuleBuilder("webhooks", "Outbound webhook subscriptions and delivery log")
        .table("webhooks",
            "name TEXT NOT NULL,\n"
            "  url TEXT NOT NULL,\n"
            "  secret TEXT,\n"
            "  events TEXT[] NOT NULL DEFAULT '{}',\n"
            "  is_active BOOLEAN DEFAULT true,\n"
            "  retry_count INTEGER DEFAULT 3,\n"
            "  created_by UUID REFERENCES public.users(id),\n"
            "  agency_id UUID")
        .table("webhook_deliveries",
            "webhook_id UUID NOT NULL REFERENCES public.webhooks(id) ON DELETE CASCADE,\n"
            "  event_type TEXT NOT NULL,\n"
            "  payload JSONB,\n"
            "  response_status INTEGER,\n"
            "  response_body TEXT,\n"
            "  attempt INTEGER DEFAULT 1,\n"
            "  delivered_at TIMESTAMP WITH TIME ZONE")
        .index("webhook_deliveries", "webhook_id")
        .build();
}

SchemaModule sso() {
    return SchemaModuleBuilder("sso", "Single sign-on providers and linked identities")
        .table("sso_configurations",
            "provider TEXT NOT NULL,\n"
            "  name TEXT NOT NULL,\n"
            "  client_id TEXT,\n"
            "  client_secret TEXT,\n"
            "  issuer_url TEXT,\n"
            "  metadata JSONB,\n"
            "  is_active BOOLEAN DEFAULT false,\n"
            "  agency_id UUID")
        .table("user_sso_identities",
            "user_id UUID NOT NULL REFERENCES public.users(id) ON DELETE CASCADE,\n"
            "  sso_configuration_id UUID NOT NULL REFERENCES public.sso_configurations(id) ON DELETE CASCADE,\n"
            "  external_id TEXT NOT NULL,\n"
            "  last_login_at TIMESTAMP WITH TIME ZONE,\n"
            "  UNIQUE (sso_configuration_id, external_id)")
        .build();
}

SchemaModule misc() {
    return SchemaModuleBuilder("misc", "Calendar, documents, feature flags and module settings")
        .table("holidays",
            "name TEXT NOT NULL,\n"
            "  date DATE NOT NULL,\n"
            "  is_company_holiday BOOLEAN DEFAULT true,\n"
            "  is_national_holiday BOOLEAN DEFAULT false,\n"
            "  description TEXT,\n"
            "  agency_id UUID")
        .table("company_events",
            "title TEXT NOT NULL,\n"
            "  description TEXT,\n"
            "  event_type TEXT DEFAULT 'meeting',\n"
            "  start_date TIMESTAMP WITH TIME ZONE NOT NULL,\n"
            "  end_date TIMESTAMP WITH TIME ZONE,\n"
            "  location TEXT,\n"
            "  created_by UUID REFERENCES public.users(id),\n"
            "  agency_id UUID")
        .table("calendar_settings",
            "agency_id UUID,\n"
            "  working_days INTEGER[] DEFAULT ARRAY[1, 2, 3, 4, 5],\n"
            "  work_start_time TIME DEFAULT '09:00',\n"
            "  work_end_time TIME DEFAULT '17:00',\n"
            "  timezone TEXT DEFAULT 'UTC'")
        .table("reports",
            "name TEXT NOT NULL,\n"
            "  report_type TEXT NOT NULL,\n"
            "  parameters JSONB,\n"
            "  file_path TEXT,\n"
            "  generated_by UUID REFERENCES public.users(id),\n"
            "  agency_id UUID")
        .table("role_change_requests",
            "user_id UUID NOT NULL REFERENCES public.users(id) ON DELETE CASCADE,\n"
            "  requested_role TEXT NOT NULL,\n"
            "  current_role TEXT,\n"
            "  reason TEXT,\n"
            "  status TEXT DEFAULT 'pending',\n"
            "  reviewed_by UUID REFERENCES public.users(id),\n"
            "  reviewed_at TIMESTAMP WITH TIME ZONE")
        .table("feature_flags",
            "key TEXT NOT NULL UNIQUE,\n"
            "  description TEXT,\n"
            "  is_enabled BOOLEAN DEFAULT false,\n"
            "  rollout_percentage INTEGER DEFAULT 0")
        .table("file_storage",
            "bucket_name TEXT NOT NULL,\n"
            "  file_path TEXT NOT NULL,\n"
            "  file_name TEXT NOT NULL,\n"
            "  mime_type TEXT,\n"
            "  file_size BIGINT,\n"
            "  uploaded_by UUID REFERENCES public.users(id),\n"
            "  UNIQUE (bucket_name, file_path)")
        .table("document_folders",
            "name TEXT NOT NULL,\n"
            "  parent_id UUID REFERENCES public.document_folders(id) ON DELETE CASCADE,\n"
            "  created_by UUID REFERENCES public.users(id),\n"
            "  agency_id UUID")
        .table("documents",
            "folder_id UUID REFERENCES public.document_folders(id) ON DELETE SET NULL,\n"
            "  name TEXT NOT NULL,\n"
            "  file_path TEXT NOT NULL,\n"
            "  mime_type TEXT,\n"
            "  file_size BIGINT,\n"
            "  uploaded_by UUID REFERENCES public.users(id),\n"
            "  agency_id UUID")
        .table("document_versions",
            "document_id UUID NOT NULL REFERENCES public.documents(id) ON DELETE CASCADE,\n"
            "  version_number INTEGER NOT NULL,\n"
            "  file_path TEXT NOT NULL,\n"
            "  uploaded_by UUID REFERENCES public.users(id)")
        .table("document_permissions",
            "document_id UUID NOT NULL REFERENCES public.documents(id) ON DELETE CASCADE,\n"
            "  user_id UUID REFERENCES public.users(id) ON DELETE CASCADE,\n"
            "  role TEXT,\n"
            "  permission TEXT NOT NULL DEFAULT 'read'")
        .table("module_settings",
            "module_name TEXT NOT NULL UNIQUE,\n"
            "  is_enabled BOOLEAN DEFAULT true,\n"
            "  settings JSONB DEFAULT '{}'::jsonb")
        .index("holidays", "date")
        .index("documents", "folder_id")
        .build();
}

SchemaModule messaging() {
    return SchemaModuleBuilder("messaging", "Channels, threads and messages")
        .table("message_channels",
            "name TEXT NOT NULL,\n"
            "  description TEXT,\n"
            "  channel_type TEXT DEFAULT 'public',\n"
            "  is_archived BOOLEAN DEFAULT false,\n"
            "  created_by UUID REFERENCES public.users(id),\n"
            "  agency_id UUID")
        .table("message_threads",
            "channel_id UUID REFERENCES public.message_channels(id) ON DELETE CASCADE,\n"
            "  subject TEXT,\n"
            "  thread_type TEXT DEFAULT 'channel',\n"
            "  last_message_at TIMESTAMP WITH TIME ZONE,\n"
            "  created_by UUID REFERENCES public.users(id)")
        .table("messages",
            "thread_id UUID NOT NULL REFERENCES public.message_threads(id) ON DELETE CASCADE,\n"
            "  sender_id UUID NOT NULL REFERENCES public.users(id),\n"
            "  content TEXT NOT NULL,\n"
            "  parent_message_id UUID REFERENCES public.messages(id) ON DELETE SET NULL,\n"
            "  is_edited BOOLEAN DEFAULT false,\n"
            "  is_deleted BOOLEAN DEFAULT false")
        .table("thread_participants",
            "thread_id UUID NOT NULL REFERENCES public.message_threads(id) ON DELETE CASCADE,\n"
            "  user_id UUID NOT NULL REFERENCES public.users(id) ON DELETE CASCADE,\n"
            "  UNIQUE (thread_id, user_id)")
        .table("channel_members",
            "channel_id UUID NOT NULL REFERENCES public.message_channels(id) ON DELETE CASCADE,\n"
            "  user_id UUID NOT NULL REFERENCES public.users(id) ON DELETE CASCADE,\n"
            "  role TEXT DEFAULT 'member',\n"
            "  UNIQUE (channel_id, user_id)")
        .table("message_reactions",
            "message_id UUID NOT NULL REFERENCES public.messages(id) ON DELETE CASCADE,\n"
            "  user_id UUID NOT NULL REFERENCES public.users(id) ON DELETE CASCADE,\n"
            "  emoji TEXT NOT NULL,\n"
            "  UNIQUE (message_id, user_id, emoji)")
        .table("message_mentions",
            "message_id UUID NOT NULL REFERENCES public.messages(id) ON DELETE CASCADE,\n"
            "  mentioned_user_id UUID NOT NULL REFERENCES public.users(id) ON DELETE CASCADE")
        .table("message_attachments",
            "message_id UUID NOT NULL REFERENCES public.messages(id) ON DELETE CASCADE,\n"
            "  file_name TEXT NOT NULL,\n"
            "  file_path TEXT NOT NULL,\n"
            "  mime_type TEXT,\n"
            "  file_size BIGINT")
        .table("message_reads",
            "message_id UUID NOT NULL REFERENCES public.messages(id) ON DELETE CASCADE,\n"
            "  user_id UUID NOT NULL REFERENCES public.users(id) ON DELETE CASCADE,\n"
            "  read_at TIMESTAMP WITH TIME ZONE DEFAULT NOW(),\n"
            "  UNIQUE (message_id, user_id)")
        .table("message_drafts",
            "thread_id UUID REFERENCES public.message_threads(id) ON DELETE CASCADE,\n"
            "  user_id UUID NOT NULL REFERENCES public.users(id) ON DELETE CASCADE,\n"
            "  content TEXT")
        .table("message_pins",
            "message_id UUID NOT NULL REFERENCES public.messages(id) ON DELETE CASCADE,\n"
            "  pinned_by UUID NOT NULL REFERENCES public.users(id)")
        .index("messages", "thread_id")
        .build();
}

SchemaModule slack() {
    return SchemaModuleBuilder("slack", "Slack workspace integration")
        .table("slack_integrations",
            "team_id TEXT NOT NULL,\n"
            "  team_name TEXT,\n"
            "  bot_token TEXT,\n"
            "  is_active BOOLEAN DEFAULT true,\n"
            "  installed_by UUID REFERENCES public.users(id),\n"
            "  agency_id UUID")
        .table("slack_channel_mappings",
            "integration_id UUID NOT NULL REFERENCES public.slack_integrations(id) ON DELETE CASCADE,\n"
            "  slack_channel_id TEXT NOT NULL,\n"
            "  channel_id UUID REFERENCES public.message_channels(id) ON DELETE CASCADE,\n"
            "  sync_direction TEXT DEFAULT 'both'")
        .table("slack_message_sync",
            "mapping_id UUID NOT NULL REFERENCES public.slack_channel_mappings(id) ON DELETE CASCADE,\n"
            "  message_id UUID REFERENCES public.messages(id) ON DELETE CASCADE,\n"
            "  slack_ts TEXT NOT NULL,\n"
            "  synced_at TIMESTAMP WITH TIME ZONE DEFAULT NOW()")
        .table("slack_user_mappings",
            "integration_id UUID NOT NULL REFERENCES public.slack_integrations(id) ON DELETE CASCADE,\n"
            "  slack_user_id TEXT NOT NULL,\n"
            "  user_id UUID REFERENCES public.users(id) ON DELETE CASCADE,\n"
            "  UNIQUE (integration_id, slack_user_id)")
        .build();
}

SchemaModule asset_management() {
    return SchemaModuleBuilder("asset_management", "Fixed assets, depreciation and maintenance")
        .table("asset_categories",
            "name TEXT NOT NULL,\n"
            "  description TEXT,\n"
            "  depreciation_method TEXT DEFAULT 'straight_line',\n"
            "  useful_life_years INTEGER,\n"
            "  agency_id UUID")
        .table("asset_locations",
            "name TEXT NOT NULL,\n"
            "  address TEXT,\n"
            "  agency_id UUID")
        .table("assets",
            "asset_number TEXT NOT NULL,\n"
            "  name TEXT NOT NULL,\n"
            "  category_id UUID REFERENCES public.asset_categories(id),\n"
            "  location_id UUID REFERENCES public.asset_locations(id),\n"
            "  purchase_date DATE,\n"
            "  purchase_cost NUMERIC(15, 2),\n"
            "  current_value NUMERIC(15, 2),\n"
            "  status TEXT DEFAULT 'active',\n"
            "  assigned_to UUID REFERENCES public.users(id),\n"
            "  agency_id UUID")
        .table("asset_depreciation",
            "asset_id UUID NOT NULL REFERENCES public.assets(id) ON DELETE CASCADE,\n"
            "  period_date DATE NOT NULL,\n"
            "  depreciation_amount NUMERIC(15, 2) NOT NULL,\n"
            "  book_value NUMERIC(15, 2)")
        .table("asset_maintenance",
            "asset_id UUID NOT NULL REFERENCES public.assets(id) ON DELETE CASCADE,\n"
            "  maintenance_type TEXT NOT NULL,\n"
            "  scheduled_date DATE,\n"
            "  completed_date DATE,\n"
            "  cost NUMERIC(15, 2),\n"
            "  notes TEXT")
        .table("asset_disposals",
            "asset_id UUID NOT NULL REFERENCES public.assets(id) ON DELETE CASCADE,\n"
            "  disposal_date DATE NOT NULL,\n"
            "  disposal_method TEXT,\n"
            "  proceeds NUMERIC(15, 2),\n"
            "  approved_by UUID REFERENCES public.users(id)")
        .build();
}

SchemaModule workflow() {
    return SchemaModuleBuilder("workflow", "Approval workflows and automation rules")
        .table("workflows",
            "name TEXT NOT NULL,\n"
            "  description TEXT,\n"
            "  entity_type TEXT NOT NULL,\n"
            "  is_active BOOLEAN DEFAULT true,\n"
            "  created_by UUID REFERENCES public.users(id),\n"
            "  agency_id UUID")
        .table("workflow_steps",
            "workflow_id UUID NOT NULL REFERENCES public.workflows(id) ON DELETE CASCADE,\n"
            "  step_order INTEGER NOT NULL,\n"
            "  name TEXT NOT NULL,\n"
            "  approver_role TEXT,\n"
            "  approver_id UUID REFERENCES public.users(id)")
        .table("workflow_instances",
            "workflow_id UUID NOT NULL REFERENCES public.workflows(id) ON DELETE CASCADE,\n"
            "  entity_id UUID NOT NULL,\n"
            "  current_step INTEGER DEFAULT 1,\n"
            "  status TEXT DEFAULT 'pending',\n"
            "  started_by UUID REFERENCES public.users(id)")
        .table("workflow_approvals",
            "instance_id UUID NOT NULL REFERENCES public.workflow_instances(id) ON DELETE CASCADE,\n"
            "  step_id UUID NOT NULL REFERENCES public.workflow_steps(id) ON DELETE CASCADE,\n"
            "  approver_id UUID REFERENCES public.users(id),\n"
            "  decision TEXT,\n"
            "  comments TEXT,\n"
            "  decided_at TIMESTAMP WITH TIME ZONE")
        .table("automation_rules",
            "name TEXT NOT NULL,\n"
            "  trigger_event TEXT NOT NULL,\n"
            "  conditions JSONB DEFAULT '{}'::jsonb,\n"
            "  actions JSONB DEFAULT '[]'::jsonb,\n"
            "  is_active BOOLEAN DEFAULT true,\n"
            "  agency_id UUID")
        .build();
}

SchemaModule integration_hub() {
    return SchemaModuleBuilder("integration_hub", "API keys and third-party integrations")
        .table("api_keys",
            "name TEXT NOT NULL,\n"
            "  key_prefix TEXT NOT NULL,\n"
            "  key_hash TEXT NOT NULL UNIQUE,\n"
            "  scopes TEXT[] DEFAULT '{}',\n"
            "  expires_at TIMESTAMP WITH TIME ZONE,\n"
            "  last_used_at TIMESTAMP WITH TIME ZONE,\n"
            "  is_active BOOLEAN DEFAULT true,\n"
            "  created_by UUID REFERENCES public.users(id),\n"
            "  agency_id UUID")
        .table("integrations",
            "name TEXT NOT NULL,\n"
            "  integration_type TEXT NOT NULL,\n"
            "  config JSONB DEFAULT '{}'::jsonb,\n"
            "  webhook_id UUID REFERENCES public.webhooks(id) ON DELETE SET NULL,\n"
            "  status TEXT DEFAULT 'inactive',\n"
            "  agency_id UUID")
        .table("integration_logs",
            "integration_id UUID NOT NULL REFERENCES public.integrations(id) ON DELETE CASCADE,\n"
            "  direction TEXT NOT NULL,\n"
            "  status TEXT NOT NULL,\n"
            "  request_payload JSONB,\n"
            "  response_payload JSONB,\n"
            "  error_message TEXT")
        .index("integration_logs", "integration_id")
        .build();
}

SchemaModule indexes_and_fixes() {
    return SchemaModuleBuilder("indexes_and_fixes", "Cross-module indexes and late column fixes")
        .column("users", "agency_id", "UUID")
        .column("profiles", "agency_id", "UUID")
        .column("projects", "department_id", "UUID")
        .index("users", "agency_id")
        .index("projects", "client_id")
        .index("projects", "status")
        .index("clients", "agency_id")
        .index("invoices", "status")
        .index("attendance", "employee_id, date")
        .index("leave_requests", "status")
        .index("audit_logs", "user_id")
        .build();
}

} // namespace tenantcore::schema_modules
