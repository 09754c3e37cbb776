#include "feed_parser.h"
#include "date_parse.h"
#include <absl/strings/ascii.h>
#include <absl/strings/str_cat.h>
#include <libxml/parser.h>
#include <libxml/tree.h>
#include <libxml/xmlerror.h>
#include <cstring>
#include <string>
#include <vector>

struct KnownNs {
  const char* href;
  const char* prefix; // "" for the format's own vocabulary
};

// Namespaced elements are matched as "prefix:local" using these fixed
// prefixes, whatever prefix the document happened to declare.
constexpr KnownNs kKnownNs[] = {
    {"http://purl.org/rss/1.0/", ""},
    {"http://www.w3.org/2005/Atom", "atom"},
    {"http://purl.org/atom/ns#", "atom"},
    {"http://purl.org/rss/1.0/modules/content/", "content"},
    {"http://purl.org/dc/elements/1.1/", "dc"},
    {"http://purl.org/dc/terms/", "dcterms"},
    {"http://www.itunes.com/dtds/podcast-1.0.dtd", "itunes"},
    {"http://www.w3.org/1999/02/22-rdf-syntax-ns#", "rdf"},
};

constexpr const char* kDateFields[] = {"published", "updated", "created"};

static bool is_element(const xmlNode* n) { return n && n->type == XML_ELEMENT_NODE; }

static std::string local_name(const xmlNode* n) { return reinterpret_cast<const char*>(n->name); }

static std::string ns_name(const xmlNode* n) {
  std::string local = local_name(n);
  if (!n->ns || !n->ns->href) return local;
  const char* href = reinterpret_cast<const char*>(n->ns->href);
  for (const auto& k : kKnownNs) {
    if (std::strcmp(href, k.href) == 0) {
      return k.prefix[0] ? absl::StrCat(k.prefix, ":", local) : local;
    }
  }
  if (n->ns->prefix) return absl::StrCat(reinterpret_cast<const char*>(n->ns->prefix), ":", local);
  return local;
}

// Atom 1.0 and 0.3 share element names; extension elements are skipped.
static bool in_atom_ns(const xmlNode* n) {
  if (!n->ns || !n->ns->href) return true;
  const char* href = reinterpret_cast<const char*>(n->ns->href);
  return std::strcmp(href, "http://www.w3.org/2005/Atom") == 0 ||
         std::strcmp(href, "http://purl.org/atom/ns#") == 0;
}

static std::string node_text(xmlNode* node) {
  xmlChar* content = xmlNodeGetContent(node);
  if (!content) return {};
  std::string s(reinterpret_cast<char*>(content));
  xmlFree(content);
  return std::string(absl::StripAsciiWhitespace(s));
}

static std::string attr(xmlNode* node, const char* name) {
  xmlChar* v = xmlGetProp(node, BAD_CAST name);
  if (!v) return {};
  std::string s = reinterpret_cast<char*>(v);
  xmlFree(v);
  return std::string(absl::StripAsciiWhitespace(s));
}

// Serialized children of an element, for Atom type="xhtml" content.
static std::string inner_xml(xmlDoc* doc, xmlNode* node) {
  std::string out;
  xmlBufferPtr buf = xmlBufferCreate();
  if (!buf) return node_text(node);
  for (xmlNode* c = node->children; c; c = c->next) {
    xmlBufferEmpty(buf);
    if (xmlNodeDump(buf, doc, c, 0, 0) >= 0) {
      out.append(reinterpret_cast<const char*>(xmlBufferContent(buf)), xmlBufferLength(buf));
    }
  }
  xmlBufferFree(buf);
  return std::string(absl::StripAsciiWhitespace(out));
}

// First value wins; empty values never claim a field.
static void set_once(RawEntry& e, const std::string& key, std::string value) {
  if (value.empty() || e.fields.count(key)) return;
  e.fields.emplace(key, std::move(value));
}

static void finish_entry(RawEntry& e) {
  for (const char* name : kDateFields) {
    auto it = e.fields.find(name);
    if (it == e.fields.end()) continue;
    if (auto ms = parse_date_strict(it->second)) e.parsed_dates.emplace(name, *ms);
  }
}

static RawEntry parse_rss_item(xmlNode* item) {
  RawEntry e;
  set_once(e, "id", attr(item, "about")); // RSS 1.0 rdf:about

  for (xmlNode* c = item->children; c; c = c->next) {
    if (!is_element(c)) continue;
    const std::string name = ns_name(c);

    if (name == "guid") {
      // An explicit guid outranks rdf:about.
      std::string guid = node_text(c);
      if (!guid.empty()) e.fields["id"] = std::move(guid);
    } else if (name == "link") {
      set_once(e, "link", node_text(c));
    } else if (name == "atom:link") {
      std::string rel = attr(c, "rel");
      if (rel.empty() || rel == "alternate") set_once(e, "link", attr(c, "href"));
    } else if (name == "title") {
      set_once(e, "title", node_text(c));
    } else if (name == "description") {
      set_once(e, "description", node_text(c));
    } else if (name == "itunes:summary") {
      set_once(e, "summary", node_text(c));
    } else if (name == "content:encoded") {
      std::string value = node_text(c);
      if (!value.empty()) e.content.push_back(ContentBlock{"html", std::move(value)});
    } else if (name == "pubDate" || name == "atom:published" || name == "dcterms:issued") {
      set_once(e, "published", node_text(c));
    } else if (name == "dc:date" || name == "atom:updated" || name == "dcterms:modified") {
      set_once(e, "updated", node_text(c));
    } else if (name == "dcterms:created") {
      set_once(e, "created", node_text(c));
    } else if (name == "author" || name == "dc:creator") {
      set_once(e, "author", node_text(c));
    }
  }
  finish_entry(e);
  return e;
}

static std::string atom_link(xmlNode* entry) {
  std::string first;
  for (xmlNode* c = entry->children; c; c = c->next) {
    if (!is_element(c) || !in_atom_ns(c) || local_name(c) != "link") continue;
    std::string href = attr(c, "href");
    if (href.empty()) continue;
    std::string rel = attr(c, "rel");
    if (rel.empty() || rel == "alternate") return href;
    if (first.empty()) first = href;
  }
  return first;
}

static RawEntry parse_atom_entry(xmlDoc* doc, xmlNode* entry) {
  RawEntry e;
  set_once(e, "link", atom_link(entry));

  for (xmlNode* c = entry->children; c; c = c->next) {
    if (!is_element(c)) continue;
    if (!in_atom_ns(c)) {
      const std::string name = ns_name(c);
      if (name == "dc:creator") set_once(e, "author", node_text(c));
      else if (name == "dc:date") set_once(e, "updated", node_text(c));
      continue;
    }
    const std::string name = local_name(c);

    if (name == "id") {
      set_once(e, "id", node_text(c));
    } else if (name == "title") {
      set_once(e, "title", node_text(c));
    } else if (name == "summary") {
      set_once(e, "summary", node_text(c));
    } else if (name == "content") {
      std::string type = attr(c, "type");
      if (type.empty()) type = "text";
      std::string value = (type == "xhtml") ? inner_xml(doc, c) : node_text(c);
      if (!value.empty()) e.content.push_back(ContentBlock{std::move(type), std::move(value)});
    } else if (name == "published" || name == "issued") {
      set_once(e, "published", node_text(c));
    } else if (name == "updated" || name == "modified") {
      set_once(e, "updated", node_text(c));
    } else if (name == "created") {
      set_once(e, "created", node_text(c));
    } else if (name == "author") {
      for (xmlNode* a = c->children; a; a = a->next) {
        if (is_element(a) && local_name(a) == "name") set_once(e, "author", node_text(a));
      }
    }
  }
  finish_entry(e);
  return e;
}

static std::optional<std::string> child_title(xmlNode* parent) {
  for (xmlNode* c = parent->children; c; c = c->next) {
    if (is_element(c) && local_name(c) == "title" && ns_name(c) == "title") {
      std::string t = node_text(c);
      if (!t.empty()) return t;
      return std::nullopt;
    }
  }
  return std::nullopt;
}

static std::optional<std::string> atom_title(xmlNode* feed) {
  for (xmlNode* c = feed->children; c; c = c->next) {
    if (is_element(c) && in_atom_ns(c) && local_name(c) == "title") {
      std::string t = node_text(c);
      if (!t.empty()) return t;
      return std::nullopt;
    }
  }
  return std::nullopt;
}

static void parse_rss(xmlNode* root, ParseResult& out) {
  for (xmlNode* ch = root->children; ch; ch = ch->next) {
    if (!is_element(ch)) continue;
    const std::string name = ns_name(ch);
    if (name == "channel") {
      if (!out.title) out.title = child_title(ch);
      // RSS 0.9x/2.0 nest items in the channel.
      for (xmlNode* it = ch->children; it; it = it->next) {
        if (is_element(it) && ns_name(it) == "item") out.entries.push_back(parse_rss_item(it));
      }
    } else if (name == "item") {
      // RSS 1.0 keeps items beside the channel.
      out.entries.push_back(parse_rss_item(ch));
    }
  }
}

static void parse_atom(xmlDoc* doc, xmlNode* root, ParseResult& out) {
  out.title = atom_title(root);
  for (xmlNode* c = root->children; c; c = c->next) {
    if (is_element(c) && in_atom_ns(c) && local_name(c) == "entry") {
      out.entries.push_back(parse_atom_entry(doc, c));
    }
  }
}

static std::string libxml_message(xmlParserCtxtPtr ctxt) {
  const xmlError* err = xmlCtxtGetLastError(ctxt);
  if (!err || !err->message) return "document is not well-formed XML";
  std::string msg(absl::StripAsciiWhitespace(err->message));
  return absl::StrCat(msg, " (line ", err->line, ")");
}

const std::string* RawEntry::field(const std::string& name) const {
  auto it = fields.find(name);
  return it == fields.end() ? nullptr : &it->second;
}

ParseResult parse_feed_bytes(const std::string& bytes) {
  ParseResult out;
  if (absl::StripAsciiWhitespace(bytes).empty()) {
    out.error = "empty document";
    return out;
  }

  xmlParserCtxtPtr ctxt = xmlNewParserCtxt();
  if (!ctxt) {
    out.error = "could not allocate XML parser";
    return out;
  }

  xmlDocPtr doc = xmlCtxtReadMemory(ctxt, bytes.data(), (int)bytes.size(), "feed.xml", nullptr,
                                    XML_PARSE_RECOVER | XML_PARSE_NONET | XML_PARSE_NOERROR |
                                    XML_PARSE_NOWARNING | XML_PARSE_NOCDATA);
  const bool well_formed = ctxt->wellFormed != 0;
  std::string diagnostic = well_formed ? std::string() : libxml_message(ctxt);

  xmlNode* root = doc ? xmlDocGetRootElement(doc) : nullptr;
  if (!root) {
    out.error = diagnostic.empty() ? std::string("document has no root element") : diagnostic;
    if (doc) xmlFreeDoc(doc);
    xmlFreeParserCtxt(ctxt);
    return out;
  }

  const std::string root_name = local_name(root);
  if (xmlStrcasecmp(root->name, BAD_CAST "rss") == 0 || root_name == "RDF") {
    parse_rss(root, out);
  } else if (root_name == "feed") {
    parse_atom(doc, root, out);
  } else {
    out.error = absl::StrCat("document is not an RSS or Atom feed (root element <", root_name, ">)");
    xmlFreeDoc(doc);
    xmlFreeParserCtxt(ctxt);
    return out;
  }

  if (well_formed) {
    out.status = ParseStatus::kClean;
  } else {
    out.status = ParseStatus::kTolerated;
    out.error = diagnostic;
  }

  xmlFreeDoc(doc);
  xmlFreeParserCtxt(ctxt);
  return out;
}

ParseResult parse_feed_url(const std::string& url, const HttpOptions& opt, const FetchFn& fetch) {
  FetchResult fetched = fetch(url, opt);
  if (!fetched.ok()) {
    ParseResult out;
    out.transport = fetched.error.value_or(TransportError{});
    out.error = describe_transport_error(*out.transport);
    out.effective_url = url;
    return out;
  }

  ParseResult out = parse_feed_bytes(fetched.response->body);
  out.effective_url = fetched.response->effective_url.empty() ? url : fetched.response->effective_url;
  return out;
}
