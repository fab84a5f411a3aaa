#include "intercept_script.h"

#include <stdio.h>

#include <include/cef_base.h>

const char kInstallInterceptMessage[] = "minifin_install_intercept";
const char kButtonClickedMessage[] = "minifin_button_clicked";
const char kInstallResultMessage[] = "minifin_install_result";
const char kHostObjectName[] = "minifinHost";

static const char *kInterceptScript = R"JS(
(function(){
  return function(requiredClasses, eventId, generation){
    var host = window.minifinHost;
    if(!host || typeof host.buttonClicked !== 'function') return 'no-host';

    var registry = window.__minifinIntercepts;
    if(!registry){
      registry = Object.create(null);
      Object.defineProperty(window, '__minifinIntercepts', { value: registry });
    }
    var key = eventId + '\u001f' + requiredClasses.join('\u001f');
    var entry = registry[key];
    if(!entry){
      entry = { generation: generation, observer: null, listener: null };
      entry.listener = function(e){
        e.preventDefault();
        e.stopPropagation();
        e.stopImmediatePropagation();
        host.buttonClicked(eventId, entry.generation);
      };
      registry[key] = entry;
    }
    entry.generation = generation;
    var tokens = requiredClasses.join(' ');

    function matches(node){
      if(!node.classList) return false;
      for(var i=0;i<requiredClasses.length;i++){
        if(!node.classList.contains(requiredClasses[i])) return false;
      }
      return true;
    }

    function override(el){
      el.onclick = null;
      el.removeEventListener('click', entry.listener, true);
      el.addEventListener('click', entry.listener, true);
    }

    function scan(root){
      var count = 0;
      if(root.nodeType === 1 && matches(root)){
        override(root);
        count++;
      }
      if(root.getElementsByClassName){
        var found = root.getElementsByClassName(tokens);
        for(var i=0;i<found.length;i++){
          override(found[i]);
          count++;
        }
      }
      return count;
    }

    var initial = scan(document);

    if(!entry.observer){
      entry.observer = new MutationObserver(function(mutations){
        for(var m=0;m<mutations.length;m++){
          var added = mutations[m].addedNodes;
          for(var n=0;n<added.length;n++){
            if(added[n].nodeType === 1) scan(added[n]);
          }
        }
      });
      entry.observer.observe(document.documentElement || document, { childList: true, subtree: true });
    }
    return 'installed:' + initial;
  };
})()
)JS";

const char *intercept_script_source()
{
    return kInterceptScript;
}

static void write_request_args(CefRefPtr<CefListValue> args, const InterceptRequest &request, int generation)
{
    args->SetInt(0, generation);
    args->SetString(1, request.event_id);
    CefRefPtr<CefListValue> classes = CefListValue::Create();
    for (size_t i = 0; i < request.required_classes.size(); ++i) {
        classes->SetString(i, request.required_classes[i]);
    }
    args->SetList(2, classes);
}

static bool read_request_args(CefRefPtr<CefListValue> args, InterceptRequest *out_request, int *out_generation)
{
    if (!args || args->GetSize() < 3) return false;
    if (args->GetType(0) != VTYPE_INT || args->GetType(1) != VTYPE_STRING ||
        args->GetType(2) != VTYPE_LIST) {
        return false;
    }
    InterceptRequest request;
    request.event_id = args->GetString(1).ToString();
    CefRefPtr<CefListValue> classes = args->GetList(2);
    for (size_t i = 0; classes && i < classes->GetSize(); ++i) {
        if (classes->GetType(i) != VTYPE_STRING) return false;
        request.required_classes.push_back(classes->GetString(i).ToString());
    }
    if (!validate_intercept_request(request, nullptr)) return false;
    *out_generation = args->GetInt(0);
    *out_request = request;
    return true;
}

CefRefPtr<CefProcessMessage> build_install_message(const InterceptRequest &request, int generation)
{
    CefRefPtr<CefProcessMessage> message = CefProcessMessage::Create(kInstallInterceptMessage);
    write_request_args(message->GetArgumentList(), request, generation);
    return message;
}

bool parse_install_message(CefRefPtr<CefProcessMessage> message,
                           InterceptRequest *out_request,
                           int *out_generation)
{
    if (!message || !out_request || !out_generation) return false;
    if (message->GetName().ToString() != kInstallInterceptMessage) return false;
    return read_request_args(message->GetArgumentList(), out_request, out_generation);
}

CefRefPtr<CefProcessMessage> build_install_result_message(const InterceptRequest &request,
                                                          int generation,
                                                          bool installed)
{
    CefRefPtr<CefProcessMessage> message = CefProcessMessage::Create(kInstallResultMessage);
    CefRefPtr<CefListValue> args = message->GetArgumentList();
    write_request_args(args, request, generation);
    args->SetBool(3, installed);
    return message;
}

bool parse_install_result_message(CefRefPtr<CefProcessMessage> message,
                                  InterceptRequest *out_request,
                                  int *out_generation,
                                  bool *out_installed)
{
    if (!message || !out_request || !out_generation || !out_installed) return false;
    if (message->GetName().ToString() != kInstallResultMessage) return false;
    CefRefPtr<CefListValue> args = message->GetArgumentList();
    if (!args || args->GetSize() < 4 || args->GetType(3) != VTYPE_BOOL) return false;
    if (!read_request_args(args, out_request, out_generation)) return false;
    *out_installed = args->GetBool(3);
    return true;
}

bool parse_button_clicked_message(CefRefPtr<CefProcessMessage> message,
                                  std::string *out_event_id,
                                  int *out_generation)
{
    if (!message || !out_event_id || !out_generation) return false;
    if (message->GetName().ToString() != kButtonClickedMessage) return false;
    CefRefPtr<CefListValue> args = message->GetArgumentList();
    if (!args || args->GetSize() < 2) return false;
    if (args->GetType(0) != VTYPE_STRING || args->GetType(1) != VTYPE_INT) return false;
    *out_event_id = args->GetString(0).ToString();
    *out_generation = args->GetInt(1);
    return true;
}

namespace {

class HostCallbackHandler : public CefV8Handler {
 public:
  bool Execute(const CefString &name,
               CefRefPtr<CefV8Value> object,
               const CefV8ValueList &arguments,
               CefRefPtr<CefV8Value> &retval,
               CefString &exception) override {
    (void)object;
    if (name.ToString() != "buttonClicked") return false;
    if (arguments.empty() || !arguments[0]->IsString()) {
      exception = "buttonClicked(eventId, generation) expects a string event id";
      return true;
    }
    int generation = -1;
    if (arguments.size() > 1 && arguments[1]->IsInt()) {
      generation = arguments[1]->GetIntValue();
    }
    CefRefPtr<CefV8Context> ctx = CefV8Context::GetCurrentContext();
    CefRefPtr<CefFrame> frame = ctx ? ctx->GetFrame() : nullptr;
    if (!frame) return true;
    CefRefPtr<CefProcessMessage> message = CefProcessMessage::Create(kButtonClickedMessage);
    CefRefPtr<CefListValue> args = message->GetArgumentList();
    args->SetString(0, arguments[0]->GetStringValue());
    args->SetInt(1, generation);
    frame->SendProcessMessage(PID_BROWSER, message);
    retval = CefV8Value::CreateBool(true);
    return true;
  }

 private:
  IMPLEMENT_REFCOUNTING(HostCallbackHandler);
};

} // namespace

void register_host_object(CefRefPtr<CefV8Context> context)
{
    if (!context || !context->IsValid()) return;
    CefRefPtr<CefV8Value> window = context->GetGlobal();
    if (!window) return;
    CefRefPtr<CefV8Handler> handler = new HostCallbackHandler();
    CefRefPtr<CefV8Value> host = CefV8Value::CreateObject(nullptr, nullptr);
    host->SetValue("buttonClicked",
                   CefV8Value::CreateFunction("buttonClicked", handler),
                   V8_PROPERTY_ATTRIBUTE_READONLY);
    window->SetValue(kHostObjectName,
                     host,
                     static_cast<cef_v8_propertyattribute_t>(V8_PROPERTY_ATTRIBUTE_READONLY |
                                                             V8_PROPERTY_ATTRIBUTE_DONTDELETE));
}

bool run_intercept_script(CefRefPtr<CefFrame> frame, const InterceptRequest &request, int generation)
{
    if (!frame) return false;
    CefRefPtr<CefV8Context> ctx = frame->GetV8Context();
    if (!ctx || !ctx->IsValid()) return false;
    if (!ctx->Enter()) return false;

    CefRefPtr<CefV8Value> installer;
    CefRefPtr<CefV8Exception> exception;
    bool ok = ctx->Eval(intercept_script_source(), "minifin_intercept.js", 1, installer, exception);
    if (!ok || !installer || !installer->IsFunction()) {
        if (exception) {
            fprintf(stderr,
                    "[minifin-renderer] intercept script exception: %s @ %s:%d\n",
                    exception->GetMessage().ToString().c_str(),
                    exception->GetScriptResourceName().ToString().c_str(),
                    exception->GetLineNumber());
        }
        ctx->Exit();
        return false;
    }

    CefRefPtr<CefV8Value> classes = CefV8Value::CreateArray((int)request.required_classes.size());
    for (size_t i = 0; i < request.required_classes.size(); ++i) {
        classes->SetValue((int)i, CefV8Value::CreateString(request.required_classes[i]));
    }
    CefV8ValueList args;
    args.push_back(classes);
    args.push_back(CefV8Value::CreateString(request.event_id));
    args.push_back(CefV8Value::CreateInt(generation));

    CefRefPtr<CefV8Value> result = installer->ExecuteFunction(nullptr, args);
    bool installed = false;
    if (installer->HasException()) {
        CefRefPtr<CefV8Exception> call_exception = installer->GetException();
        fprintf(stderr,
                "[minifin-renderer] intercept install for '%s' threw: %s\n",
                request.event_id.c_str(),
                call_exception ? call_exception->GetMessage().ToString().c_str() : "(unknown)");
        installer->ClearException();
    } else if (result && result->IsString()) {
        std::string status = result->GetStringValue().ToString();
        installed = status.rfind("installed:", 0) == 0;
        fprintf(stderr,
                "[minifin-renderer] intercept '%s' generation=%d status=%s\n",
                request.event_id.c_str(),
                generation,
                status.c_str());
    }
    ctx->Exit();
    return installed;
}
