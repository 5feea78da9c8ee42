#include "facade/script_facade.hpp"

#include <algorithm>

namespace script_facade {

static bool has_capability(const FacadeOptions &options, const std::string &name) {
    return std::find(options.capabilities.begin(), options.capabilities.end(), name) != options.capabilities.end();
}

static bool has_any_capability(const FacadeOptions &options, const std::vector<std::string> &names) {
    for (const auto &name : names) {
        if (has_capability(options, name)) {
            return true;
        }
    }
    return false;
}

// window.__capbridge: id allocation, pending promises and watch routing.
// Events that arrive before their watchPosition result are queued per id.
static std::string core_section(const FacadeOptions &options) {
    json capability_list = options.capabilities;
    return
        "var binding=" + json(options.binding_name).dump() + ";"
        "var capabilities=" + capability_list.dump() + ";"
        "var nextId=1;"
        "var pending={};"
        "var watchers={};"
        "var early={};"
        "function define(target,name,value){"
        "try{Object.defineProperty(target,name,{value:value,configurable:true,writable:true});}"
        "catch(e){try{target[name]=value;}catch(ignored){}}"
        "}"
        "function send(message){"
        "var sink=window[binding];"
        "if(typeof sink!=='function'){return false;}"
        "sink(JSON.stringify(message));"
        "return true;"
        "}"
        "function makeError(detail){"
        "detail=detail||{};"
        "var error=new Error(detail.message||detail.kind||'OperationFailed');"
        "error.name=detail.kind||'OperationFailed';"
        "error.kind=detail.kind||'OperationFailed';"
        "return error;"
        "}"
        "function call(capability,args){"
        "return new Promise(function(resolve,reject){"
        "var id=nextId++;"
        "pending[id]={resolve:resolve,reject:reject};"
        "if(!send({type:'call',id:id,capability:capability,arguments:args||{}})){"
        "delete pending[id];"
        "reject(makeError({kind:'BridgeDisposed',message:'bridge binding is not installed'}));"
        "}"
        "});"
        "}"
        "function resolveResult(message){"
        "if(typeof message==='string'){message=JSON.parse(message);}"
        "var entry=pending[message.id];"
        "if(!entry){return;}"
        "delete pending[message.id];"
        "if(message.ok){entry.resolve(message.value);}else{entry.reject(makeError(message.error));}"
        "}"
        "function routeEvent(message){"
        "if(typeof message==='string'){message=JSON.parse(message);}"
        "var handler=watchers[message.subscription];"
        "if(handler){handler(message);return;}"
        "(early[message.subscription]=early[message.subscription]||[]).push(message);"
        "}"
        "function watch(id,handler){"
        "watchers[id]=handler;"
        "var queued=early[id];"
        "delete early[id];"
        "if(queued){queued.forEach(handler);}"
        "}"
        "function unwatch(id){delete watchers[id];delete early[id];}"
        "function ignore(){}"
        "Object.defineProperty(window,'__capbridge',{value:{"
        "call:call,resolve:resolveResult,event:routeEvent,watch:watch,unwatch:unwatch,"
        "capabilities:capabilities.slice()"
        "},configurable:false,writable:false});";
}

static std::string clipboard_section(const FacadeOptions &options) {
    std::string script =
        "var clipboard=navigator.clipboard;"
        "if(!clipboard){clipboard={};define(navigator,'clipboard',clipboard);}";
    if (has_capability(options, "clipboard.write")) {
        script +=
            "define(clipboard,'writeText',function(text){"
            "return call('clipboard.write',{text:String(text)}).then(function(){return undefined;});"
            "});";
    }
    if (has_capability(options, "clipboard.read")) {
        script +=
            "define(clipboard,'readText',function(){return call('clipboard.read',{});});";
    }
    return script;
}

static std::string share_section() {
    return
        "function shareArgs(data){"
        "data=data||{};"
        "var args={};"
        "['title','text','url'].forEach(function(key){"
        "if(data[key]!==undefined&&data[key]!==null){args[key]=String(data[key]);}"
        "});"
        "return args;"
        "}"
        "define(navigator,'share',function(data){"
        "return call('share',shareArgs(data)).then(function(){return undefined;});"
        "});"
        "define(navigator,'canShare',function(data){"
        "var args=shareArgs(data);"
        "return Object.keys(args).some(function(key){return args[key].length>0;});"
        "});";
}

// Notification constructor: show is fire-and-forget, failures surface through onerror.
static std::string notification_section(const FacadeOptions &options) {
    std::string script =
        "var notificationPermission='default';"
        "function BridgeNotification(title,options){"
        "options=options||{};"
        "this.title=String(title);"
        "this.body=options.body?String(options.body):'';"
        "this.icon=options.icon?String(options.icon):'';"
        "this.tag=options.tag?String(options.tag):'';"
        "this.onclick=null;this.onshow=null;this.onerror=null;this.onclose=null;"
        "var self=this;"
        "var args={title:this.title};"
        "if(this.body){args.body=this.body;}"
        "if(this.icon){args.icon=this.icon;}"
        "if(this.tag){args.tag=this.tag;}";
    if (has_capability(options, "notification.show")) {
        script +=
            "call('notification.show',args).then(function(){"
            "if(typeof self.onshow==='function'){self.onshow();}"
            "},function(error){"
            "if(error.kind==='PermissionDenied'){notificationPermission='denied';}"
            "if(typeof self.onerror==='function'){self.onerror(error);}"
            "});";
    }
    script +=
        "}"
        "BridgeNotification.prototype.close=function(){"
        "if(typeof this.onclose==='function'){this.onclose();}"
        "};"
        "Object.defineProperty(BridgeNotification,'permission',{get:function(){return notificationPermission;}});";
    if (has_capability(options, "notification.requestPermission")) {
        script +=
            "BridgeNotification.requestPermission=function(callback){"
            "return call('notification.requestPermission',{}).then(function(state){"
            "notificationPermission=state;"
            "if(typeof callback==='function'){callback(state);}"
            "return state;"
            "});"
            "};";
    }
    script += "define(window,'Notification',BridgeNotification);";
    return script;
}

// navigator.geolocation with callback-style success/error. watchPosition must
// return a handle synchronously, so the facade hands out local handles and
// maps them to bridge subscription ids once the call resolves.
static std::string geolocation_section(const FacadeOptions &options) {
    std::string script =
        "var positionErrorCodes={PermissionDenied:1,CapabilityUnavailable:2,OperationFailed:2,Timeout:3};"
        "function positionError(detail){"
        "detail=detail||{};"
        "return {code:positionErrorCodes[detail.kind]||2,message:detail.message||detail.kind||'',"
        "PERMISSION_DENIED:1,POSITION_UNAVAILABLE:2,TIMEOUT:3};"
        "}"
        "function positionArgs(options){"
        "options=options||{};"
        "var args={};"
        "if(options.enableHighAccuracy!==undefined){args.enableHighAccuracy=!!options.enableHighAccuracy;}"
        "if(typeof options.timeout==='number'&&isFinite(options.timeout)){args.timeout=Math.max(0,options.timeout);}"
        "if(typeof options.maximumAge==='number'&&isFinite(options.maximumAge)){args.maximumAge=Math.max(0,options.maximumAge);}"
        "return args;"
        "}"
        "var geolocation={};";
    if (has_capability(options, "geolocation.getCurrentPosition")) {
        script +=
            "geolocation.getCurrentPosition=function(success,failure,options){"
            "call('geolocation.getCurrentPosition',positionArgs(options)).then(function(position){"
            "if(typeof success==='function'){success(position);}"
            "},function(error){"
            "if(typeof failure==='function'){failure(positionError(error));}"
            "});"
            "};";
    }
    if (has_capability(options, "geolocation.watchPosition") && has_capability(options, "geolocation.clearWatch")) {
        script +=
            "var nextWatchHandle=1;"
            "var localWatches={};"
            "geolocation.watchPosition=function(success,failure,options){"
            "var handle=nextWatchHandle++;"
            "var state={id:null,cleared:false};"
            "localWatches[handle]=state;"
            "call('geolocation.watchPosition',positionArgs(options)).then(function(result){"
            "state.id=result.watchId;"
            "if(state.cleared){call('geolocation.clearWatch',{watchId:result.watchId}).catch(ignore);return;}"
            "watch(result.watchId,function(message){"
            "if(message.error){if(typeof failure==='function'){failure(positionError(message.error));}}"
            "else if(typeof success==='function'){success(message.event);}"
            "});"
            "},function(error){"
            "delete localWatches[handle];"
            "if(typeof failure==='function'){failure(positionError(error));}"
            "});"
            "return handle;"
            "};"
            "geolocation.clearWatch=function(handle){"
            "var state=localWatches[handle];"
            "if(!state){return;}"
            "delete localWatches[handle];"
            "state.cleared=true;"
            "if(state.id!==null){unwatch(state.id);call('geolocation.clearWatch',{watchId:state.id}).catch(ignore);}"
            "};";
    }
    script += "define(navigator,'geolocation',geolocation);";
    return script;
}

// navigator.vibrate answers synchronously like the web API; the call itself is fire-and-forget.
static std::string vibrate_section() {
    return
        "define(navigator,'vibrate',function(pattern){"
        "var steps=Array.isArray(pattern)?pattern.map(Number):Number(pattern);"
        "var invalid=Array.isArray(steps)?steps.some(function(step){return !isFinite(step)||step<0;})"
        ":(!isFinite(steps)||steps<0);"
        "if(invalid){return false;}"
        "call('vibrate',{pattern:steps}).catch(ignore);"
        "return true;"
        "});";
}

static std::string battery_section() {
    return
        "define(navigator,'getBattery',function(){"
        "return call('battery.get',{}).then(function(battery){"
        "battery.onchargingchange=null;battery.onlevelchange=null;"
        "battery.addEventListener=ignore;battery.removeEventListener=ignore;"
        "return battery;"
        "});"
        "});";
}

static std::string network_section() {
    return
        "var connection={type:'unknown',effectiveType:'4g',downlink:10,rtt:50,saveData:false,onchange:null,"
        "addEventListener:ignore,removeEventListener:ignore};"
        "function refreshConnection(){"
        "call('network.get',{}).then(function(info){"
        "var changed=info.type!==connection.type||info.effectiveType!==connection.effectiveType;"
        "Object.keys(info).forEach(function(key){connection[key]=info[key];});"
        "if(changed&&typeof connection.onchange==='function'){connection.onchange();}"
        "}).catch(ignore);"
        "}"
        "define(navigator,'connection',connection);"
        "refreshConnection();"
        "window.addEventListener('online',refreshConnection);"
        "window.addEventListener('offline',refreshConnection);";
}

static std::string orientation_section(const FacadeOptions &options) {
    std::string script =
        "var orientation={type:'portrait-primary',angle:0,onchange:null,"
        "addEventListener:ignore,removeEventListener:ignore};"
        "var refreshOrientation=ignore;";
    if (has_capability(options, "screenOrientation.get")) {
        script +=
            "refreshOrientation=function(){"
            "call('screenOrientation.get',{}).then(function(info){"
            "orientation.type=info.type;orientation.angle=info.angle;"
            "}).catch(ignore);"
            "};"
            "refreshOrientation();"
            "window.addEventListener('orientationchange',function(){refreshOrientation();});";
    }
    if (has_capability(options, "screenOrientation.lock")) {
        script +=
            "orientation.lock=function(type){"
            "return call('screenOrientation.lock',{orientation:String(type)}).then(function(){"
            "refreshOrientation();"
            "return undefined;"
            "});"
            "};";
    }
    if (has_capability(options, "screenOrientation.unlock")) {
        script +=
            "orientation.unlock=function(){"
            "call('screenOrientation.unlock',{}).then(function(){refreshOrientation();}).catch(ignore);"
            "};";
    }
    script += "define(screen,'orientation',orientation);";
    return script;
}

// The original console method still runs after forwarding.
static std::string console_section() {
    return
        "['log','info','warn','error','debug'].forEach(function(level){"
        "var original=console[level];"
        "console[level]=function(){"
        "var args=Array.prototype.slice.call(arguments).map(function(value){"
        "if(typeof value==='string'){return value;}"
        "try{var text=JSON.stringify(value);return text===undefined?String(value):text;}"
        "catch(e){return String(value);}"
        "});"
        "send({type:'console',level:level,args:args});"
        "if(typeof original==='function'){return original.apply(console,arguments);}"
        "};"
        "});";
}

std::string build_facade_script(const FacadeOptions &options) {
    std::string script = "(function(){if(window.__capbridge){return;}";
    script += core_section(options);

    if (has_any_capability(options, {"clipboard.write", "clipboard.read"})) {
        script += clipboard_section(options);
    }
    if (has_capability(options, "share")) {
        script += share_section();
    }
    if (has_any_capability(options, {"notification.requestPermission", "notification.show"})) {
        script += notification_section(options);
    }
    if (has_any_capability(options, {"geolocation.getCurrentPosition", "geolocation.watchPosition"})) {
        script += geolocation_section(options);
    }
    if (has_capability(options, "vibrate")) {
        script += vibrate_section();
    }
    if (has_capability(options, "battery.get")) {
        script += battery_section();
    }
    if (has_capability(options, "network.get")) {
        script += network_section();
    }
    if (has_any_capability(options, {"screenOrientation.get", "screenOrientation.lock", "screenOrientation.unlock"})) {
        script += orientation_section(options);
    }
    if (options.forward_console) {
        script += console_section();
    }

    script += "})();";
    return script;
}

// Invalid UTF-8 from the OS becomes U+FFFD instead of aborting the delivery.
static std::string dump_for_script(const json &message) {
    return message.dump(-1, ' ', false, json::error_handler_t::replace);
}

std::string build_result_delivery(const json &result_message) {
    return "window.__capbridge&&window.__capbridge.resolve(" + dump_for_script(result_message) + ")";
}

std::string build_event_delivery(const json &event_message) {
    return "window.__capbridge&&window.__capbridge.event(" + dump_for_script(event_message) + ")";
}

} // namespace script_facade
